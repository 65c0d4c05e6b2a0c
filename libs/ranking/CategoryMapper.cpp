// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "CategoryMapper.h"

namespace abcrank
{
  std::vector<InventoryItem> applyMappings(const std::vector<InventoryItem>& items,
					   const MappingTable& table)
  {
    std::vector<InventoryItem> mapped;
    mapped.reserve(items.size());

    for (const auto& item : items)
      {
	InventoryItem m(item);
	m.riskScore = table.lookup(QualitativeAttribute::RISK, item.risk);
	m.fluctuationScore = table.lookup(QualitativeAttribute::DEMAND_FLUCTUATION, item.demandFluctuation);
	m.consignmentScore = table.lookup(QualitativeAttribute::CONSIGNMENT_STOCK, item.consignmentStock);
	m.sizeScore = table.lookup(QualitativeAttribute::UNIT_SIZE, item.unitSize);
	mapped.push_back(m);
      }

    return mapped;
  }

  std::vector<FuzzyRatedItem> applyFuzzyMappings(const std::vector<InventoryItem>& items,
						 const FuzzyNumberTable& table)
  {
    std::vector<FuzzyRatedItem> rated;
    rated.reserve(items.size());

    for (const auto& item : items)
      {
	FuzzyRatedItem r;
	r.item = item;
	r.risk = table.lookup(QualitativeAttribute::RISK, item.risk);
	r.demandFluctuation = table.lookup(QualitativeAttribute::DEMAND_FLUCTUATION, item.demandFluctuation);
	r.consignmentStock = table.lookup(QualitativeAttribute::CONSIGNMENT_STOCK, item.consignmentStock);
	r.unitSize = table.lookup(QualitativeAttribute::UNIT_SIZE, item.unitSize);
	rated.push_back(r);
      }

    return rated;
  }
}
