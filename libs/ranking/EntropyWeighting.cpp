// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "EntropyWeighting.h"
#include "Normalization.h"
#include <cmath>

namespace abcrank
{
  double columnEntropy(const std::vector<double>& column)
  {
    const double k = 1.0 / std::log(static_cast<double>(column.size()));

    std::vector<double> shifted = minMaxNormalize(column);
    double total = 0.0;
    for (auto& x : shifted)
      {
	x += kEntropyEpsilon;
	total += x;
      }

    double sum = 0.0;
    for (double x : shifted)
      {
	const double p = x / total;
	sum += p * std::log(p);
      }

    return -k * sum;
  }

  namespace
  {
    using CriterionValues = std::array<double, kNumDecisionCriteria>;

    // Fills diversity with 1 - E per criterion and returns their sum
    double calculateDiversities(const std::vector<InventoryItem>& items, CriterionValues& diversity)
    {
      double totalDiversity = 0.0;

      for (DecisionCriterion criterion : allDecisionCriteria())
	{
	  const std::size_t c = static_cast<std::size_t>(criterion);
	  const double entropy = columnEntropy(extractColumn(items, decisionCriterionColumn(criterion)));

	  diversity[c] = 1.0 - entropy;
	  totalDiversity += diversity[c];
	}

      return totalDiversity;
    }
  }

  EntropyWeights calculateEntropyWeights(const std::vector<InventoryItem>& items)
  {
    if (items.size() < 2)
      return EntropyWeights::equalWeights();

    CriterionValues diversity;
    const double totalDiversity = calculateDiversities(items, diversity);

    if (std::fabs(totalDiversity) < kDegenerateDiversity)
      return EntropyWeights::equalWeights();

    CriterionValues weights;
    for (std::size_t c = 0; c < kNumDecisionCriteria; ++c)
      weights[c] = diversity[c] / totalDiversity;

    return EntropyWeights(weights);
  }

  bool usesEqualWeightFallback(const std::vector<InventoryItem>& items)
  {
    if (items.size() < 2)
      return true;

    CriterionValues diversity;
    return std::fabs(calculateDiversities(items, diversity)) < kDegenerateDiversity;
  }
}
