// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __DESCRIPTIVE_STATISTICS_H
#define __DESCRIPTIVE_STATISTICS_H 1

#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "InventoryItem.h"

namespace abcrank
{
  struct DescriptiveStatistics
  {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double stdDev = 0.0;
  };

  /**
   * @brief Summary statistics of a series.
   *
   * stdDev is the population standard deviation (divide by n). The median
   * of an even-length series is the mean of the two middle values. An
   * empty series yields all zeros.
   */
  DescriptiveStatistics calculateStats(const std::vector<double>& values);

  struct CorrelationMatrix
  {
    std::vector<std::string> labels;
    std::vector<std::vector<double>> matrix;
  };

  /**
   * @brief Pearson correlation between every pair of the given columns.
   *
   * Moments are population moments. A pair involving a column with zero
   * standard deviation correlates as 0, diagonal included. Labels are the
   * column names in the order requested.
   */
  CorrelationMatrix calculateCorrelationMatrix(const std::vector<InventoryItem>& items,
					       const std::vector<ItemColumn>& columns);

  using CategoryCount = std::pair<std::string, std::size_t>;

  /**
   * @brief Number of items per label of one categorical attribute, labels
   * in order of first appearance.
   */
  std::vector<CategoryCount> calculateCategoryDistribution(const std::vector<InventoryItem>& items,
							   QualitativeAttribute attribute);

  using ColumnStatistics = std::pair<ItemColumn, DescriptiveStatistics>;

  // Average stock, Daily usage, Unit cost and Lead time, in that order.
  std::vector<ColumnStatistics> describeQuantitativeColumns(const std::vector<InventoryItem>& items);
}

#endif
