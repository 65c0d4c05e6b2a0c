// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CRITERIA_AGGREGATOR_H
#define __CRITERIA_AGGREGATOR_H 1

#include <vector>
#include "InventoryItem.h"
#include "RankingConfiguration.h"

namespace abcrank
{
  /**
   * @brief Combines mapped scores and normalized quantities into the three
   * second level criteria.
   *
   * Average stock, daily usage and lead time are min-max normalized over
   * the whole item set before they are combined; unit cost is not used
   * here. Per item:
   *
   *   Criticality_Agg = wRisk * Risk_Score + wFluct * Fluctuation_Score
   *   Demand_Agg      = wUsage * norm(Daily usage) + wStock * norm(Average stock)
   *   Supply_Agg      = wLead * norm(Lead time) + wConsign * Consignment_Score
   *
   * Results are not clamped.
   */
  std::vector<InventoryItem> calculateAggregations(const std::vector<InventoryItem>& items,
						   const AggregationWeights& weights);
}

#endif
