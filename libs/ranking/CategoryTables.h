// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CATEGORY_TABLES_H
#define __CATEGORY_TABLES_H 1

#include <array>
#include <map>
#include <string>
#include "InventoryItem.h"
#include "TriangularFuzzyNumber.h"

namespace abcrank
{
  /**
   * @brief Label lookup tables for the four qualitative attributes.
   *
   * Every attribute owns its own label -> value sub-table. A label that is
   * not present in the sub-table looks up as a value-initialized Value
   * (0.0 for crisp scores, (0,0,0) for fuzzy numbers); no diagnostic is
   * produced.
   */
  template <class Value>
  class CategoryTable
  {
  public:
    using LabelMap = std::map<std::string, Value>;

    CategoryTable() = default;

    Value lookup(QualitativeAttribute attribute, const std::string& label) const
    {
      const LabelMap& table = mTables[attributeIndex(attribute)];
      auto it = table.find(label);
      if (it == table.end())
	return Value();

      return it->second;
    }

    const LabelMap& getTable(QualitativeAttribute attribute) const
    {
      return mTables[attributeIndex(attribute)];
    }

    /**
     * @brief Replaces the whole sub-table of an attribute.
     */
    void setTable(QualitativeAttribute attribute, const LabelMap& table)
    {
      mTables[attributeIndex(attribute)] = table;
    }

    void setValue(QualitativeAttribute attribute, const std::string& label, const Value& value)
    {
      mTables[attributeIndex(attribute)][label] = value;
    }

    bool operator==(const CategoryTable<Value>& rhs) const
    {
      return mTables == rhs.mTables;
    }

    bool operator!=(const CategoryTable<Value>& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    static std::size_t attributeIndex(QualitativeAttribute attribute)
    {
      return static_cast<std::size_t>(attribute);
    }

  private:
    std::array<LabelMap, kNumQualitativeAttributes> mTables;
  };

  /**
   * @brief Crisp label -> score table.
   */
  using MappingTable = CategoryTable<double>;

  /**
   * @brief Label -> triangular fuzzy number table used by the fuzzy track.
   */
  using FuzzyNumberTable = CategoryTable<TriangularFuzzyNumber>;

  /**
   * @brief Default crisp scores:
   * Risk {High 0.47, Normal 0.35, Low 0.18},
   * Demand fluctuation {Increasing 0.36, Stable 0.28, Unknown 0.20, Decreasing 0.16, Ending 0.00},
   * Consignment stock {No 0.80, Yes 0.20},
   * Unit size {Large 0.53, Medium 0.31, Small 0.13}.
   */
  MappingTable createDefaultMappingTable();

  FuzzyNumberTable createDefaultFuzzyNumberTable();
}

#endif
