// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "CriteriaAggregator.h"
#include "Normalization.h"

namespace abcrank
{
  std::vector<InventoryItem> calculateAggregations(const std::vector<InventoryItem>& items,
						   const AggregationWeights& weights)
  {
    const std::vector<double> normDailyUsage =
      minMaxNormalize(extractColumn(items, ItemColumn::DAILY_USAGE));
    const std::vector<double> normAverageStock =
      minMaxNormalize(extractColumn(items, ItemColumn::AVERAGE_STOCK));
    const std::vector<double> normLeadTime =
      minMaxNormalize(extractColumn(items, ItemColumn::LEAD_TIME));

    std::vector<InventoryItem> aggregated;
    aggregated.reserve(items.size());

    for (std::size_t i = 0; i < items.size(); ++i)
      {
	InventoryItem item(items[i]);

	item.criticalityAgg =
	  weights.criticality.risk * item.riskScore.value_or(0.0) +
	  weights.criticality.fluctuation * item.fluctuationScore.value_or(0.0);

	item.demandAgg =
	  weights.demand.dailyUsage * normDailyUsage[i] +
	  weights.demand.averageStock * normAverageStock[i];

	item.supplyAgg =
	  weights.supply.leadTime * normLeadTime[i] +
	  weights.supply.consignment * item.consignmentScore.value_or(0.0);

	aggregated.push_back(item);
      }

    return aggregated;
  }
}
