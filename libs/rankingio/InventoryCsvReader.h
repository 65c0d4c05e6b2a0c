// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "InventoryItem.h"

namespace abcrank::io
{
  class InventoryCsvReaderException : public std::runtime_error
  {
  public:
    InventoryCsvReaderException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~InventoryCsvReaderException()
    {}
  };

  /**
   * @brief Loads inventory items from a header-bearing CSV file.
   *
   * The header must name the eight columns "Risk", "Demand fluctuation",
   * "Average stock", "Daily usage", "Unit cost", "Lead time",
   * "Consignment stock" and "Unit size", in any order. Other columns are
   * ignored.
   *
   * Rows whose eight fields are all empty are skipped. The remaining rows
   * get ids 1, 2, 3, ... in file order. Numeric fields are read leniently:
   * anything that does not start with a number reads as 0 and
   * "Lead time" keeps only its integer part.
   */
  class InventoryCsvReader
  {
  public:
    explicit InventoryCsvReader(const std::string& fileName);

    /**
     * @throws InventoryCsvReaderException if the file cannot be read, a
     * required column is missing or a row is malformed.
     */
    std::vector<InventoryItem> readFile() const;

    const std::string& getFileName() const
    {
      return mFileName;
    }

    static const std::vector<std::string>& requiredColumns();

    static double parseLenientDouble(const std::string& field);
    static int parseLenientInt(const std::string& field);

  private:
    std::string mFileName;
  };
}
