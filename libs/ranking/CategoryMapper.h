// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CATEGORY_MAPPER_H
#define __CATEGORY_MAPPER_H 1

#include <vector>
#include "InventoryItem.h"
#include "CategoryTables.h"

namespace abcrank
{
  /**
   * @brief An item together with the fuzzy ratings of its four categorical
   * attributes.
   */
  struct FuzzyRatedItem
  {
    InventoryItem item;
    TriangularFuzzyNumber risk;
    TriangularFuzzyNumber demandFluctuation;
    TriangularFuzzyNumber consignmentStock;
    TriangularFuzzyNumber unitSize;
  };

  /**
   * @brief Converts the categorical attributes into crisp scores.
   *
   * Fills riskScore, fluctuationScore, consignmentScore and sizeScore of
   * each returned item. A label missing from its sub-table scores 0.
   */
  std::vector<InventoryItem> applyMappings(const std::vector<InventoryItem>& items,
					   const MappingTable& table);

  /**
   * @brief Fuzzy analogue of applyMappings. Unknown labels rate (0,0,0).
   */
  std::vector<FuzzyRatedItem> applyFuzzyMappings(const std::vector<InventoryItem>& items,
						 const FuzzyNumberTable& table);
}

#endif
