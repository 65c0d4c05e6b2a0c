// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "csv.h"
#include "InventoryCsvReader.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace abcrank::io
{
  using InventoryCsvFile = ::io::CSVReader<8,
					   ::io::trim_chars<' ', '\t'>,
					   ::io::double_quote_escape<',', '\"'>,
					   ::io::throw_on_overflow,
					   ::io::empty_line_comment>;

  InventoryCsvReader::InventoryCsvReader(const std::string& fileName)
    : mFileName(fileName)
  {}

  const std::vector<std::string>& InventoryCsvReader::requiredColumns()
  {
    static const std::vector<std::string> columns = {
      "Risk",
      "Demand fluctuation",
      "Average stock",
      "Daily usage",
      "Unit cost",
      "Lead time",
      "Consignment stock",
      "Unit size"
    };

    return columns;
  }

  double InventoryCsvReader::parseLenientDouble(const std::string& field)
  {
    const std::string trimmed = boost::algorithm::trim_copy(field);
    if (trimmed.empty())
      return 0.0;

    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || !std::isfinite(value))
      return 0.0;

    // Hexadecimal input reads as its leading zero
    if (std::find_if(trimmed.c_str(), static_cast<const char*>(end),
		     [](char c) { return c == 'x' || c == 'X'; }) != end)
      return 0.0;

    return value;
  }

  int InventoryCsvReader::parseLenientInt(const std::string& field)
  {
    const std::string trimmed = boost::algorithm::trim_copy(field);
    if (trimmed.empty())
      return 0;

    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(trimmed.c_str(), &end, 10);
    if (end == trimmed.c_str() || errno == ERANGE || value > INT_MAX || value < INT_MIN)
      return 0;

    return static_cast<int>(value);
  }

  std::vector<InventoryItem> InventoryCsvReader::readFile() const
  {
    if (!boost::filesystem::exists(boost::filesystem::path(mFileName)))
      throw InventoryCsvReaderException("InventoryCsvReader: inventory file " + mFileName + " does not exist");

    std::vector<InventoryItem> items;

    try
      {
	InventoryCsvFile csvFile(mFileName.c_str());
	csvFile.read_header(::io::ignore_extra_column | ::io::ignore_missing_column,
			    "Risk", "Demand fluctuation", "Average stock", "Daily usage",
			    "Unit cost", "Lead time", "Consignment stock", "Unit size");

	std::vector<std::string> missingColumns;
	for (const auto& column : requiredColumns())
	  if (!csvFile.has_column(column))
	    missingColumns.push_back(column);

	if (!missingColumns.empty())
	  throw InventoryCsvReaderException("InventoryCsvReader: " + mFileName +
					    " is missing required columns: " +
					    boost::algorithm::join(missingColumns, ", "));

	std::string risk, demandFluctuation, averageStock, dailyUsage;
	std::string unitCost, leadTime, consignmentStock, unitSize;
	int nextId = 1;

	while (csvFile.read_row(risk, demandFluctuation, averageStock, dailyUsage,
				unitCost, leadTime, consignmentStock, unitSize))
	  {
	    if (risk.empty() && demandFluctuation.empty() && averageStock.empty() &&
		dailyUsage.empty() && unitCost.empty() && leadTime.empty() &&
		consignmentStock.empty() && unitSize.empty())
	      continue;

	    InventoryItem item;
	    item.id = nextId++;
	    item.risk = boost::algorithm::trim_copy(risk);
	    item.demandFluctuation = boost::algorithm::trim_copy(demandFluctuation);
	    item.averageStock = parseLenientDouble(averageStock);
	    item.dailyUsage = parseLenientDouble(dailyUsage);
	    item.unitCost = parseLenientDouble(unitCost);
	    item.leadTime = parseLenientInt(leadTime);
	    item.consignmentStock = boost::algorithm::trim_copy(consignmentStock);
	    item.unitSize = boost::algorithm::trim_copy(unitSize);
	    items.push_back(item);
	  }
      }
    catch (const ::io::error::base& e)
      {
	throw InventoryCsvReaderException("InventoryCsvReader: error reading " + mFileName +
					  ": " + e.what());
      }

    return items;
  }
}
