// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <stdexcept>
#include <string>
#include "RankingConfiguration.h"

namespace abcrank::io
{
  class RankingConfigurationException : public std::runtime_error
  {
  public:
    RankingConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~RankingConfigurationException()
    {}
  };

  /**
   * @brief Reads ranking configuration overrides from a JSON document.
   *
   * Recognized top level members, all optional:
   *
   *   "mappings"           { "<attribute>": { "<label>": score, ... }, ... }
   *   "fuzzyNumbers"       { "<attribute>": { "<label>": [l, m, u], ... }, ... }
   *   "aggregationWeights" { "Criticality": { "Risk": w, "Fluctuation": w },
   *                          "Demand":      { "DailyUsage": w, "AverageStock": w },
   *                          "Supply":      { "LeadTime": w, "Consignment": w } }
   *   "abcThresholds"      { "A": a, "B": b, "C": c }
   *
   * Attribute names are the import column names ("Risk",
   * "Demand fluctuation", "Consignment stock", "Unit size"). A supplied
   * attribute sub-table replaces the default one entirely; individual
   * weights and thresholds override only the value they name. Anything
   * not supplied keeps its value in the base configuration.
   *
   * Only the shape of the document is checked: numbers must be
   * non-negative and fuzzy numbers must satisfy 0 <= l <= m <= u <= 1.
   * Whether weight pairs sum to one is not checked.
   */
  class RankingConfigurationReader
  {
  public:
    explicit RankingConfigurationReader(const std::string& configurationFileName);

    /**
     * @throws RankingConfigurationException if the file is missing, is not
     * valid JSON or has the wrong shape.
     */
    RankingConfiguration readConfigurationFile() const;

    static RankingConfiguration parseConfiguration(const std::string& jsonText,
						   const RankingConfiguration& base = RankingConfiguration());

    /**
     * @brief Writes every table, weight and threshold of a configuration
     * in the format parseConfiguration reads.
     */
    static std::string toJson(const RankingConfiguration& configuration);

  private:
    std::string mConfigurationFileName;
  };
}
