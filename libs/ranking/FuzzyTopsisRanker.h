// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __FUZZY_TOPSIS_RANKER_H
#define __FUZZY_TOPSIS_RANKER_H 1

#include <array>
#include <vector>
#include "InventoryItem.h"
#include "CategoryTables.h"
#include "TriangularFuzzyNumber.h"

namespace abcrank
{
  constexpr std::size_t kFuzzyCriteriaCount = 8;

  using FuzzyCriteriaRow = std::array<TriangularFuzzyNumber, kFuzzyCriteriaCount>;

  /**
   * @brief Builds the fuzzy decision matrix, one row per item in input order.
   *
   * Column order: Risk, Demand fluctuation, Average stock, Daily usage,
   * Unit cost, Lead time, Consignment stock, Unit size. The four
   * quantitative columns are min-max normalized over the whole item set
   * and carried as point TFNs (l = m = u).
   */
  std::vector<FuzzyCriteriaRow> buildFuzzyDecisionMatrix(const std::vector<InventoryItem>& items,
							 const FuzzyNumberTable& table);

  /**
   * @brief Fuzzy TOPSIS using the vertex method.
   *
   * Every criterion gets weight 1/8. The ideal points are FPIS = (1,1,1)
   * and FNIS = (0,0,0), weighted the same way. For each item
   * d+ = sqrt(sum_c vertexDistanceSquared(w*x_c, w*FPIS)) and likewise d-
   * against FNIS; FUZZY_TOPSIS_Score = d- / (d+ + d-).
   *
   * Items are returned in input order with fuzzyTopsisScore set.
   */
  std::vector<InventoryItem> calculateFuzzyTOPSIS(const std::vector<InventoryItem>& items,
						  const FuzzyNumberTable& table);
}

#endif
