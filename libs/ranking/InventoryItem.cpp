// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "InventoryItem.h"
#include <stdexcept>

namespace abcrank
{
  double getColumnValue(const InventoryItem& item, ItemColumn column)
  {
    switch (column)
      {
      case ItemColumn::RISK_SCORE:
	return item.riskScore.value_or(0.0);
      case ItemColumn::FLUCTUATION_SCORE:
	return item.fluctuationScore.value_or(0.0);
      case ItemColumn::CONSIGNMENT_SCORE:
	return item.consignmentScore.value_or(0.0);
      case ItemColumn::SIZE_SCORE:
	return item.sizeScore.value_or(0.0);
      case ItemColumn::CRITICALITY_AGG:
	return item.criticalityAgg.value_or(0.0);
      case ItemColumn::DEMAND_AGG:
	return item.demandAgg.value_or(0.0);
      case ItemColumn::SUPPLY_AGG:
	return item.supplyAgg.value_or(0.0);
      case ItemColumn::UNIT_COST:
	return item.unitCost;
      case ItemColumn::AVERAGE_STOCK:
	return item.averageStock;
      case ItemColumn::DAILY_USAGE:
	return item.dailyUsage;
      case ItemColumn::LEAD_TIME:
	return static_cast<double>(item.leadTime);
      case ItemColumn::TOPSIS_SCORE:
	return item.topsisScore.value_or(0.0);
      case ItemColumn::FUZZY_TOPSIS_SCORE:
	return item.fuzzyTopsisScore.value_or(0.0);
      }

    return 0.0;
  }

  std::vector<double> extractColumn(const std::vector<InventoryItem>& items, ItemColumn column)
  {
    std::vector<double> values;
    values.reserve(items.size());

    for (const auto& item : items)
      values.push_back(getColumnValue(item, column));

    return values;
  }

  const std::string& getQualitativeValue(const InventoryItem& item, QualitativeAttribute attribute)
  {
    switch (attribute)
      {
      case QualitativeAttribute::RISK:
	return item.risk;
      case QualitativeAttribute::DEMAND_FLUCTUATION:
	return item.demandFluctuation;
      case QualitativeAttribute::CONSIGNMENT_STOCK:
	return item.consignmentStock;
      case QualitativeAttribute::UNIT_SIZE:
	return item.unitSize;
      }

    throw std::invalid_argument("getQualitativeValue: unknown qualitative attribute");
  }

  std::string itemColumnName(ItemColumn column)
  {
    switch (column)
      {
      case ItemColumn::RISK_SCORE:
	return "Risk_Score";
      case ItemColumn::FLUCTUATION_SCORE:
	return "Fluctuation_Score";
      case ItemColumn::CONSIGNMENT_SCORE:
	return "Consignment_Score";
      case ItemColumn::SIZE_SCORE:
	return "Size_Score";
      case ItemColumn::CRITICALITY_AGG:
	return "Criticality_Agg";
      case ItemColumn::DEMAND_AGG:
	return "Demand_Agg";
      case ItemColumn::SUPPLY_AGG:
	return "Supply_Agg";
      case ItemColumn::UNIT_COST:
	return "Unit cost";
      case ItemColumn::AVERAGE_STOCK:
	return "Average stock";
      case ItemColumn::DAILY_USAGE:
	return "Daily usage";
      case ItemColumn::LEAD_TIME:
	return "Lead time";
      case ItemColumn::TOPSIS_SCORE:
	return "TOPSIS_Score";
      case ItemColumn::FUZZY_TOPSIS_SCORE:
	return "Fuzzy_TOPSIS_Score";
      }

    throw std::invalid_argument("itemColumnName: unknown column");
  }

  ItemColumn itemColumnFromName(const std::string& name)
  {
    static const ItemColumn columns[] = {
      ItemColumn::RISK_SCORE, ItemColumn::FLUCTUATION_SCORE,
      ItemColumn::CONSIGNMENT_SCORE, ItemColumn::SIZE_SCORE,
      ItemColumn::CRITICALITY_AGG, ItemColumn::DEMAND_AGG,
      ItemColumn::SUPPLY_AGG, ItemColumn::UNIT_COST,
      ItemColumn::AVERAGE_STOCK, ItemColumn::DAILY_USAGE,
      ItemColumn::LEAD_TIME, ItemColumn::TOPSIS_SCORE,
      ItemColumn::FUZZY_TOPSIS_SCORE
    };

    for (ItemColumn column : columns)
      {
	if (itemColumnName(column) == name)
	  return column;
      }

    throw std::invalid_argument("itemColumnFromName: unknown column name " + name);
  }

  std::string qualitativeAttributeName(QualitativeAttribute attribute)
  {
    switch (attribute)
      {
      case QualitativeAttribute::RISK:
	return "Risk";
      case QualitativeAttribute::DEMAND_FLUCTUATION:
	return "Demand fluctuation";
      case QualitativeAttribute::CONSIGNMENT_STOCK:
	return "Consignment stock";
      case QualitativeAttribute::UNIT_SIZE:
	return "Unit size";
      }

    throw std::invalid_argument("qualitativeAttributeName: unknown qualitative attribute");
  }

  QualitativeAttribute qualitativeAttributeFromName(const std::string& name)
  {
    for (QualitativeAttribute attribute : allQualitativeAttributes())
      {
	if (qualitativeAttributeName(attribute) == name)
	  return attribute;
      }

    throw std::invalid_argument("qualitativeAttributeFromName: unknown attribute name " + name);
  }

  const std::vector<QualitativeAttribute>& allQualitativeAttributes()
  {
    static const std::vector<QualitativeAttribute> attributes = {
      QualitativeAttribute::RISK,
      QualitativeAttribute::DEMAND_FLUCTUATION,
      QualitativeAttribute::CONSIGNMENT_STOCK,
      QualitativeAttribute::UNIT_SIZE
    };

    return attributes;
  }

  char abcClassToChar(AbcClass abcClass)
  {
    switch (abcClass)
      {
      case AbcClass::A:
	return 'A';
      case AbcClass::B:
	return 'B';
      case AbcClass::C:
	return 'C';
      }

    return 'C';
  }

  std::size_t abcClassIndex(AbcClass abcClass)
  {
    return static_cast<std::size_t>(abcClass);
  }
}
