// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __DECISION_CRITERIA_H
#define __DECISION_CRITERIA_H 1

#include <array>
#include <string>
#include <vector>
#include "InventoryItem.h"

namespace abcrank
{
  /**
   * @brief Columns of the crisp decision matrix, in matrix order.
   */
  enum class DecisionCriterion
  {
    CRITICALITY_AGG,
    DEMAND_AGG,
    SUPPLY_AGG,
    UNIT_COST,
    SIZE_SCORE
  };

  constexpr std::size_t kNumDecisionCriteria = 5;

  const std::array<DecisionCriterion, kNumDecisionCriteria>& allDecisionCriteria();

  ItemColumn decisionCriterionColumn(DecisionCriterion criterion);

  std::string decisionCriterionName(DecisionCriterion criterion);

  /**
   * @brief Benefit criteria (higher is better): Criticality_Agg,
   * Demand_Agg, Size_Score. Supply_Agg and Unit cost are cost criteria.
   */
  bool isBenefitCriterion(DecisionCriterion criterion);

  /**
   * @brief One non-negative weight per decision criterion.
   */
  class EntropyWeights
  {
  public:
    EntropyWeights()
    {
      mWeights.fill(0.0);
    }

    explicit EntropyWeights(const std::array<double, kNumDecisionCriteria>& weights)
      : mWeights(weights)
    {}

    static EntropyWeights equalWeights()
    {
      std::array<double, kNumDecisionCriteria> w;
      w.fill(1.0 / static_cast<double>(kNumDecisionCriteria));
      return EntropyWeights(w);
    }

    double getWeight(DecisionCriterion criterion) const
    {
      return mWeights[static_cast<std::size_t>(criterion)];
    }

    void setWeight(DecisionCriterion criterion, double weight)
    {
      mWeights[static_cast<std::size_t>(criterion)] = weight;
    }

    double sum() const
    {
      double total = 0.0;
      for (double w : mWeights)
	total += w;

      return total;
    }

    const std::array<double, kNumDecisionCriteria>& getWeights() const
    {
      return mWeights;
    }

  private:
    std::array<double, kNumDecisionCriteria> mWeights;
  };
}

#endif
