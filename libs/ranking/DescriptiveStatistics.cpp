// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DescriptiveStatistics.h"
#include <algorithm>
#include <cmath>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace abcrank
{
  using namespace boost::accumulators;

  namespace
  {
    using MomentAccumulator = accumulator_set<double, stats<tag::min,
							    tag::max,
							    tag::mean,
							    tag::variance>>;

    double exactMedian(std::vector<double> values)
    {
      std::sort(values.begin(), values.end());
      const std::size_t n = values.size();

      if (n % 2 == 0)
	return (values[n / 2 - 1] + values[n / 2]) / 2.0;
      else
	return values[n / 2];
    }

    double populationMean(const std::vector<double>& values)
    {
      accumulator_set<double, stats<tag::mean>> acc;
      for (double v : values)
	acc(v);

      return mean(acc);
    }
  }

  DescriptiveStatistics calculateStats(const std::vector<double>& values)
  {
    DescriptiveStatistics result;
    if (values.empty())
      return result;

    MomentAccumulator acc;
    for (double v : values)
      acc(v);

    result.min = (min)(acc);
    result.max = (max)(acc);
    result.mean = mean(acc);
    result.median = exactMedian(values);
    result.stdDev = std::sqrt(std::max(0.0, variance(acc)));

    return result;
  }

  CorrelationMatrix calculateCorrelationMatrix(const std::vector<InventoryItem>& items,
					       const std::vector<ItemColumn>& columns)
  {
    const std::size_t k = columns.size();
    const double n = static_cast<double>(items.size());

    CorrelationMatrix result;
    result.matrix.assign(k, std::vector<double>(k, 0.0));
    for (ItemColumn column : columns)
      result.labels.push_back(itemColumnName(column));

    if (items.empty())
      return result;

    std::vector<std::vector<double>> values;
    std::vector<double> means;
    std::vector<double> stdDevs;

    for (ItemColumn column : columns)
      {
	values.push_back(extractColumn(items, column));
	const double m = populationMean(values.back());

	double sumOfSquares = 0.0;
	for (double v : values.back())
	  sumOfSquares += (v - m) * (v - m);

	means.push_back(m);
	stdDevs.push_back(std::sqrt(sumOfSquares / n));
      }

    for (std::size_t i = 0; i < k; ++i)
      for (std::size_t j = 0; j < k; ++j)
	{
	  if (stdDevs[i] == 0.0 || stdDevs[j] == 0.0)
	    continue;

	  double covariance = 0.0;
	  for (std::size_t r = 0; r < items.size(); ++r)
	    covariance += (values[i][r] - means[i]) * (values[j][r] - means[j]);
	  covariance /= n;

	  result.matrix[i][j] = covariance / (stdDevs[i] * stdDevs[j]);
	}

    return result;
  }

  std::vector<CategoryCount> calculateCategoryDistribution(const std::vector<InventoryItem>& items,
							   QualitativeAttribute attribute)
  {
    std::vector<CategoryCount> distribution;

    for (const auto& item : items)
      {
	const std::string& label = getQualitativeValue(item, attribute);
	auto it = std::find_if(distribution.begin(), distribution.end(),
			       [&label](const CategoryCount& entry) {
				 return entry.first == label;
			       });

	if (it == distribution.end())
	  distribution.emplace_back(label, 1);
	else
	  ++(it->second);
      }

    return distribution;
  }

  std::vector<ColumnStatistics> describeQuantitativeColumns(const std::vector<InventoryItem>& items)
  {
    static const ItemColumn quantitativeColumns[] = {
      ItemColumn::AVERAGE_STOCK,
      ItemColumn::DAILY_USAGE,
      ItemColumn::UNIT_COST,
      ItemColumn::LEAD_TIME
    };

    std::vector<ColumnStatistics> description;
    for (ItemColumn column : quantitativeColumns)
      description.emplace_back(column, calculateStats(extractColumn(items, column)));

    return description;
  }
}
