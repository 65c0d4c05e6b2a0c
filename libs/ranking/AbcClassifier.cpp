// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "AbcClassifier.h"
#include <algorithm>
#include <cmath>
#include <numeric>

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

  AbcCutPoints::AbcCutPoints(std::size_t numItems, const AbcThresholds& thresholds)
    : mClassBStart(clampedIndex(std::floor(numItems * thresholds.a / 100.0), numItems)),
      mClassCStart(clampedIndex(std::floor(numItems * (thresholds.a + thresholds.b) / 100.0), numItems))
  {}

  AbcClass AbcCutPoints::classAt(std::size_t rankPosition) const
  {
    if (rankPosition < mClassBStart)
      return AbcClass::A;
    else if (rankPosition < mClassCStart)
      return AbcClass::B;
    else
      return AbcClass::C;
  }

  std::size_t AbcCutPoints::clampedIndex(double index, std::size_t numItems)
  {
    if (!(index > 0.0))
      return 0;

    if (index >= static_cast<double>(numItems))
      return numItems;

    return static_cast<std::size_t>(index);
  }

  std::vector<InventoryItem> classifyABC(const std::vector<InventoryItem>& items,
					 const AbcThresholds& thresholds,
					 ScoreField scoreField)
  {
    const ItemColumn column = scoreColumn(scoreField);

    std::vector<InventoryItem> ranked(items);
    std::stable_sort(ranked.begin(), ranked.end(),
		     [column](const InventoryItem& lhs, const InventoryItem& rhs) {
		       return getColumnValue(lhs, column) > getColumnValue(rhs, column);
		     });

    AbcCutPoints cutPoints(ranked.size(), thresholds);

    for (std::size_t i = 0; i < ranked.size(); ++i)
      {
	if (scoreField == ScoreField::TOPSIS_SCORE)
	  ranked[i].abcClass = cutPoints.classAt(i);
	else
	  ranked[i].fuzzyAbcClass = cutPoints.classAt(i);
      }

    return ranked;
  }

  std::vector<AbcClass> abcClassesByPosition(const std::vector<InventoryItem>& items,
					     const AbcThresholds& thresholds,
					     ScoreField scoreField)
  {
    const ItemColumn column = scoreColumn(scoreField);

    std::vector<std::size_t> rankOrder(items.size());
    std::iota(rankOrder.begin(), rankOrder.end(), 0);
    std::stable_sort(rankOrder.begin(), rankOrder.end(),
		     [&items, column](std::size_t lhs, std::size_t rhs) {
		       return getColumnValue(items[lhs], column) > getColumnValue(items[rhs], column);
		     });

    AbcCutPoints cutPoints(items.size(), thresholds);

    std::vector<AbcClass> classes(items.size(), AbcClass::C);
    for (std::size_t rank = 0; rank < rankOrder.size(); ++rank)
      classes[rankOrder[rank]] = cutPoints.classAt(rank);

    return classes;
  }
}
