// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __INVENTORY_ITEM_H
#define __INVENTORY_ITEM_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace abcrank
{
  enum class AbcClass
  {
    A,
    B,
    C
  };

  /**
   * @brief The four categorical attributes of an inventory item.
   *
   * Each one has its own sub-table in a MappingTable / FuzzyNumberTable.
   */
  enum class QualitativeAttribute
  {
    RISK,
    DEMAND_FLUCTUATION,
    CONSIGNMENT_STOCK,
    UNIT_SIZE
  };

  constexpr std::size_t kNumQualitativeAttributes = 4;

  /**
   * @brief Numeric columns that can be read off an item for statistics,
   * correlation and ranking.
   */
  enum class ItemColumn
  {
    RISK_SCORE,
    FLUCTUATION_SCORE,
    CONSIGNMENT_SCORE,
    SIZE_SCORE,
    CRITICALITY_AGG,
    DEMAND_AGG,
    SUPPLY_AGG,
    UNIT_COST,
    AVERAGE_STOCK,
    DAILY_USAGE,
    LEAD_TIME,
    TOPSIS_SCORE,
    FUZZY_TOPSIS_SCORE
  };

  /**
   * @brief One stock keeping unit.
   *
   * The raw attributes are filled in by the importer. Derived attributes
   * stay empty until the stage that computes them has been run on the
   * item; every stage returns new items and never modifies its input.
   */
  struct InventoryItem
  {
    int id = 0;

    // Raw attributes
    std::string risk;
    std::string demandFluctuation;
    double averageStock = 0.0;
    double dailyUsage = 0.0;
    double unitCost = 0.0;
    int leadTime = 0;
    std::string consignmentStock;
    std::string unitSize;

    // Mapper
    std::optional<double> riskScore;
    std::optional<double> fluctuationScore;
    std::optional<double> consignmentScore;
    std::optional<double> sizeScore;

    // Aggregator
    std::optional<double> criticalityAgg;
    std::optional<double> demandAgg;
    std::optional<double> supplyAgg;

    // Rankers and classifier
    std::optional<double> topsisScore;
    std::optional<double> fuzzyTopsisScore;
    std::optional<AbcClass> abcClass;
    std::optional<AbcClass> fuzzyAbcClass;
  };

  /**
   * @brief Returns the numeric value of a column. Derived values that have
   * not been computed yet read as zero.
   */
  double getColumnValue(const InventoryItem& item, ItemColumn column);

  std::vector<double> extractColumn(const std::vector<InventoryItem>& items, ItemColumn column);

  const std::string& getQualitativeValue(const InventoryItem& item, QualitativeAttribute attribute);

  /**
   * @brief Column names as they appear in the import file and reports
   * ("Unit cost", "Risk_Score", "TOPSIS_Score", ...).
   */
  std::string itemColumnName(ItemColumn column);

  /**
   * @throws std::invalid_argument for an unknown name
   */
  ItemColumn itemColumnFromName(const std::string& name);

  std::string qualitativeAttributeName(QualitativeAttribute attribute);

  /**
   * @throws std::invalid_argument for an unknown name
   */
  QualitativeAttribute qualitativeAttributeFromName(const std::string& name);

  const std::vector<QualitativeAttribute>& allQualitativeAttributes();

  char abcClassToChar(AbcClass abcClass);
  std::size_t abcClassIndex(AbcClass abcClass);
}

#endif
