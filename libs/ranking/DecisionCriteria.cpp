// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DecisionCriteria.h"
#include <stdexcept>

namespace abcrank
{
  const std::array<DecisionCriterion, kNumDecisionCriteria>& allDecisionCriteria()
  {
    static const std::array<DecisionCriterion, kNumDecisionCriteria> criteria = {
      DecisionCriterion::CRITICALITY_AGG,
      DecisionCriterion::DEMAND_AGG,
      DecisionCriterion::SUPPLY_AGG,
      DecisionCriterion::UNIT_COST,
      DecisionCriterion::SIZE_SCORE
    };

    return criteria;
  }

  ItemColumn decisionCriterionColumn(DecisionCriterion criterion)
  {
    switch (criterion)
      {
      case DecisionCriterion::CRITICALITY_AGG:
	return ItemColumn::CRITICALITY_AGG;
      case DecisionCriterion::DEMAND_AGG:
	return ItemColumn::DEMAND_AGG;
      case DecisionCriterion::SUPPLY_AGG:
	return ItemColumn::SUPPLY_AGG;
      case DecisionCriterion::UNIT_COST:
	return ItemColumn::UNIT_COST;
      case DecisionCriterion::SIZE_SCORE:
	return ItemColumn::SIZE_SCORE;
      }

    throw std::invalid_argument("decisionCriterionColumn: unknown decision criterion");
  }

  std::string decisionCriterionName(DecisionCriterion criterion)
  {
    return itemColumnName(decisionCriterionColumn(criterion));
  }

  bool isBenefitCriterion(DecisionCriterion criterion)
  {
    return criterion == DecisionCriterion::CRITICALITY_AGG ||
      criterion == DecisionCriterion::DEMAND_AGG ||
      criterion == DecisionCriterion::SIZE_SCORE;
  }
}
