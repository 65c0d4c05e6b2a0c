// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "TopsisRanker.h"
#include "Normalization.h"
#include <algorithm>
#include <cmath>

namespace abcrank
{
  double closenessCoefficient(double distanceToBest, double distanceToWorst)
  {
    const double denominator = distanceToBest + distanceToWorst;
    if (denominator == 0.0)
      return 0.5;

    return distanceToWorst / denominator;
  }

  WeightedDecisionMatrix::WeightedDecisionMatrix(const std::vector<InventoryItem>& items,
						 const EntropyWeights& weights)
    : mRows(items.size())
  {
    mIdealBest.fill(0.0);
    mIdealWorst.fill(0.0);

    for (DecisionCriterion criterion : allDecisionCriteria())
      {
	const std::size_t c = static_cast<std::size_t>(criterion);
	const std::vector<double> normalized =
	  vectorNormalize(extractColumn(items, decisionCriterionColumn(criterion)));
	const double weight = weights.getWeight(criterion);

	for (std::size_t i = 0; i < normalized.size(); ++i)
	  mRows[i][c] = normalized[i] * weight;

	if (mRows.empty())
	  continue;

	auto bounds = std::minmax_element(mRows.begin(), mRows.end(),
					  [c](const Row& lhs, const Row& rhs) {
					    return lhs[c] < rhs[c];
					  });
	const double columnMin = (*bounds.first)[c];
	const double columnMax = (*bounds.second)[c];

	if (isBenefitCriterion(criterion))
	  {
	    mIdealBest[c] = columnMax;
	    mIdealWorst[c] = columnMin;
	  }
	else
	  {
	    mIdealBest[c] = columnMin;
	    mIdealWorst[c] = columnMax;
	  }
      }
  }

  double WeightedDecisionMatrix::distanceToIdealBest(std::size_t row) const
  {
    return euclideanDistance(mRows[row], mIdealBest);
  }

  double WeightedDecisionMatrix::distanceToIdealWorst(std::size_t row) const
  {
    return euclideanDistance(mRows[row], mIdealWorst);
  }

  double WeightedDecisionMatrix::euclideanDistance(const Row& a, const Row& b)
  {
    double sum = 0.0;
    for (std::size_t c = 0; c < a.size(); ++c)
      {
	const double d = a[c] - b[c];
	sum += d * d;
      }

    return std::sqrt(sum);
  }

  std::vector<InventoryItem> calculateTOPSIS(const std::vector<InventoryItem>& items,
					     const EntropyWeights& weights)
  {
    WeightedDecisionMatrix matrix(items, weights);

    std::vector<InventoryItem> ranked;
    ranked.reserve(items.size());

    for (std::size_t i = 0; i < items.size(); ++i)
      {
	InventoryItem item(items[i]);
	item.topsisScore = closenessCoefficient(matrix.distanceToIdealBest(i),
						matrix.distanceToIdealWorst(i));
	ranked.push_back(item);
      }

    return ranked;
  }
}
