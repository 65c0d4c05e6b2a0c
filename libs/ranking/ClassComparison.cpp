// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ClassComparison.h"
#include <algorithm>
#include <cmath>

namespace abcrank
{
  namespace
  {
    ItemColumn scoreColumn(ScoreField scoreField)
    {
      return (scoreField == ScoreField::TOPSIS_SCORE) ?
	ItemColumn::TOPSIS_SCORE : ItemColumn::FUZZY_TOPSIS_SCORE;
    }
  }

  void ClassSummary::addItem(const std::optional<AbcClass>& abcClass)
  {
    if (abcClass)
      ++mCounts[abcClassIndex(*abcClass)];
    else
      ++mUnclassified;
  }

  std::size_t ClassSummary::getTotal() const
  {
    return mCounts[0] + mCounts[1] + mCounts[2] + mUnclassified;
  }

  double ClassSummary::getShare(AbcClass abcClass) const
  {
    const std::size_t total = getTotal();
    if (total == 0)
      return 0.0;

    return static_cast<double>(getCount(abcClass)) / static_cast<double>(total);
  }

  ClassSummary summarizeClasses(const std::vector<InventoryItem>& items, ScoreField scoreField)
  {
    ClassSummary summary;
    for (const auto& item : items)
      summary.addItem(scoreField == ScoreField::TOPSIS_SCORE ? item.abcClass : item.fuzzyAbcClass);

    return summary;
  }

  ClassificationComparison compareClassifications(const std::vector<InventoryItem>& items)
  {
    ClassificationComparison comparison;
    double totalDifference = 0.0;

    for (const auto& item : items)
      {
	if (!item.abcClass || !item.fuzzyAbcClass)
	  continue;

	const AbcClass crisp = *item.abcClass;
	const AbcClass fuzzy = *item.fuzzyAbcClass;
	const double topsis = item.topsisScore.value_or(0.0);
	const double fuzzyTopsis = item.fuzzyTopsisScore.value_or(0.0);

	++comparison.changeMatrix[abcClassIndex(crisp)][abcClassIndex(fuzzy)];
	++comparison.comparedItems;
	totalDifference += std::fabs(fuzzyTopsis - topsis);

	if (crisp == fuzzy)
	  {
	    ++comparison.agreements;
	    continue;
	  }

	ClassChange change;
	change.id = item.id;
	change.topsisScore = topsis;
	change.fuzzyTopsisScore = fuzzyTopsis;
	change.crispClass = crisp;
	change.fuzzyClass = fuzzy;
	comparison.changes.push_back(change);
      }

    if (comparison.comparedItems > 0)
      {
	const double n = static_cast<double>(comparison.comparedItems);
	comparison.agreementRate = static_cast<double>(comparison.agreements) / n;
	comparison.meanAbsoluteScoreDifference = totalDifference / n;
      }

    return comparison;
  }

  std::vector<InventoryItem> topRanked(const std::vector<InventoryItem>& items,
				       ScoreField scoreField,
				       std::size_t count)
  {
    const ItemColumn column = scoreColumn(scoreField);

    std::vector<InventoryItem> ranked(items);
    std::stable_sort(ranked.begin(), ranked.end(),
		     [column](const InventoryItem& lhs, const InventoryItem& rhs) {
		       return getColumnValue(lhs, column) > getColumnValue(rhs, column);
		     });

    if (ranked.size() > count)
      ranked.resize(count);

    return ranked;
  }
}
