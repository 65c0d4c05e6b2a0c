// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "FuzzyTopsisRanker.h"
#include "CategoryMapper.h"
#include "Normalization.h"
#include "TopsisRanker.h"
#include <cmath>

namespace abcrank
{
  std::vector<FuzzyCriteriaRow> buildFuzzyDecisionMatrix(const std::vector<InventoryItem>& items,
							 const FuzzyNumberTable& table)
  {
    const std::vector<FuzzyRatedItem> rated = applyFuzzyMappings(items, table);

    const std::vector<double> normAverageStock = minMaxNormalize(extractColumn(items, ItemColumn::AVERAGE_STOCK));
    const std::vector<double> normDailyUsage = minMaxNormalize(extractColumn(items, ItemColumn::DAILY_USAGE));
    const std::vector<double> normUnitCost = minMaxNormalize(extractColumn(items, ItemColumn::UNIT_COST));
    const std::vector<double> normLeadTime = minMaxNormalize(extractColumn(items, ItemColumn::LEAD_TIME));

    std::vector<FuzzyCriteriaRow> matrix;
    matrix.reserve(items.size());

    for (std::size_t i = 0; i < rated.size(); ++i)
      {
	matrix.push_back(FuzzyCriteriaRow{{
	      rated[i].risk,
	      rated[i].demandFluctuation,
	      TriangularFuzzyNumber::crisp(normAverageStock[i]),
	      TriangularFuzzyNumber::crisp(normDailyUsage[i]),
	      TriangularFuzzyNumber::crisp(normUnitCost[i]),
	      TriangularFuzzyNumber::crisp(normLeadTime[i]),
	      rated[i].consignmentStock,
	      rated[i].unitSize
	    }});
      }

    return matrix;
  }

  std::vector<InventoryItem> calculateFuzzyTOPSIS(const std::vector<InventoryItem>& items,
						  const FuzzyNumberTable& table)
  {
    const double weight = 1.0 / static_cast<double>(kFuzzyCriteriaCount);
    const TriangularFuzzyNumber idealBest = TriangularFuzzyNumber(1.0, 1.0, 1.0).scaled(weight);
    const TriangularFuzzyNumber idealWorst = TriangularFuzzyNumber(0.0, 0.0, 0.0).scaled(weight);

    const std::vector<FuzzyCriteriaRow> matrix = buildFuzzyDecisionMatrix(items, table);

    std::vector<InventoryItem> ranked;
    ranked.reserve(items.size());

    for (std::size_t i = 0; i < items.size(); ++i)
      {
	double positiveSum = 0.0;
	double negativeSum = 0.0;

	for (const auto& rating : matrix[i])
	  {
	    const TriangularFuzzyNumber weighted = rating.scaled(weight);
	    positiveSum += vertexDistanceSquared(weighted, idealBest);
	    negativeSum += vertexDistanceSquared(weighted, idealWorst);
	  }

	InventoryItem item(items[i]);
	item.fuzzyTopsisScore = closenessCoefficient(std::sqrt(positiveSum),
						     std::sqrt(negativeSum));
	ranked.push_back(item);
      }

    return ranked;
  }
}
