// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TOPSIS_RANKER_H
#define __TOPSIS_RANKER_H 1

#include <array>
#include <vector>
#include "InventoryItem.h"
#include "DecisionCriteria.h"

namespace abcrank
{
  /**
   * @brief Relative closeness d- / (d+ + d-).
   *
   * When both distances are zero the alternative sits on both ideal points,
   * which can only happen when they coincide; it is then rated 0.5.
   */
  double closenessCoefficient(double distanceToBest, double distanceToWorst);

  /**
   * @brief Weighted, vector-normalized decision matrix with its ideal
   * points. Rows follow the order of the items it was built from.
   */
  class WeightedDecisionMatrix
  {
  public:
    using Row = std::array<double, kNumDecisionCriteria>;

    WeightedDecisionMatrix(const std::vector<InventoryItem>& items,
			   const EntropyWeights& weights);

    const std::vector<Row>& getRows() const { return mRows; }
    const Row& getIdealBest() const { return mIdealBest; }
    const Row& getIdealWorst() const { return mIdealWorst; }

    double distanceToIdealBest(std::size_t row) const;
    double distanceToIdealWorst(std::size_t row) const;

  private:
    static double euclideanDistance(const Row& a, const Row& b);

  private:
    std::vector<Row> mRows;
    Row mIdealBest;
    Row mIdealWorst;
  };

  /**
   * @brief Crisp TOPSIS over {Criticality_Agg, Demand_Agg, Supply_Agg,
   * Unit cost, Size_Score}.
   *
   * 1. Each column is divided by its Euclidean norm (a zero norm gives a
   *    zero column).
   * 2. Columns are multiplied by their entropy weight.
   * 3. Ideal best takes the column max for benefit criteria and the min
   *    for cost criteria; ideal worst the opposite.
   * 4. d+ and d- are the Euclidean distances to the two ideal points.
   * 5. TOPSIS_Score = d- / (d+ + d-).
   *
   * Items are returned in input order with topsisScore set.
   */
  std::vector<InventoryItem> calculateTOPSIS(const std::vector<InventoryItem>& items,
					     const EntropyWeights& weights);
}

#endif
