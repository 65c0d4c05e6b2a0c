// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ENTROPY_WEIGHTING_H
#define __ENTROPY_WEIGHTING_H 1

#include <vector>
#include "InventoryItem.h"
#include "DecisionCriteria.h"

namespace abcrank
{
  /**
   * @brief Offset added to every min-max normalized value so that no
   * proportion handed to the logarithm is zero.
   */
  constexpr double kEntropyEpsilon = 0.0001;

  /**
   * @brief Total diversity below which every column is treated as
   * constant.
   */
  constexpr double kDegenerateDiversity = 1e-12;

  /**
   * @brief Shannon entropy of one decision matrix column, scaled by
   * k = 1 / ln(n).
   *
   * The column is min-max normalized, offset by kEntropyEpsilon, turned
   * into proportions p_i = x_i / sum(x) and E = -k * sum(p_i * ln(p_i)).
   *
   * Requires at least two values; callers handle n <= 1.
   */
  double columnEntropy(const std::vector<double>& column);

  /**
   * @brief Objective criterion weights from the dispersion of each column
   * of the decision matrix {Criticality_Agg, Demand_Agg, Supply_Agg,
   * Unit cost, Size_Score}.
   *
   * Diversity D_c = 1 - E_c and W_c = D_c / sum(D). The weights sum to one
   * by construction. Negative diversities are kept as they are.
   *
   * Degenerate item sets fall back to equal weights (1/5 each):
   *  - fewer than two items, where k = 1 / ln(n) is undefined;
   *  - a total diversity of (numerically) zero, which happens when every
   *    column is constant.
   */
  EntropyWeights calculateEntropyWeights(const std::vector<InventoryItem>& items);

  /**
   * @brief True when calculateEntropyWeights would fall back to equal
   * weights for these items.
   */
  bool usesEqualWeightFallback(const std::vector<InventoryItem>& items);
}

#endif
