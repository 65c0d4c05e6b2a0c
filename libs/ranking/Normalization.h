// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __NORMALIZATION_H
#define __NORMALIZATION_H 1

#include <algorithm>
#include <cmath>
#include <vector>

namespace abcrank
{
  /**
   * @brief Min-max scales a series onto [0, 1].
   *
   * A constant series (max == min, which includes a single element) maps
   * every entry to exactly one half so that a column without spread is not
   * pushed towards either end of the scale. An empty series yields an
   * empty result.
   *
   * @tparam Num floating point type
   * @param values The series to scale.
   * @return A series of the same length with every entry in [0, 1].
   */
  template <class Num>
  std::vector<Num> minMaxNormalize(const std::vector<Num>& values)
  {
    std::vector<Num> normalized;
    normalized.reserve(values.size());

    if (values.empty())
      return normalized;

    const auto bounds = std::minmax_element(values.begin(), values.end());
    const Num minValue = *bounds.first;
    const Num maxValue = *bounds.second;

    if (maxValue == minValue)
      {
	normalized.assign(values.size(), Num(0.5));
	return normalized;
      }

    const Num range = maxValue - minValue;
    for (const Num& v : values)
      normalized.push_back((v - minValue) / range);

    return normalized;
  }

  /**
   * @brief Euclidean (L2) norm of a column, used by TOPSIS vector
   * normalization.
   */
  template <class Num>
  Num euclideanNorm(const std::vector<Num>& values)
  {
    Num sumOfSquares(0);
    for (const Num& v : values)
      sumOfSquares += v * v;

    return std::sqrt(sumOfSquares);
  }

  /**
   * @brief Divides every entry by the column's Euclidean norm. A column
   * whose norm is zero normalizes to all zeros.
   */
  template <class Num>
  std::vector<Num> vectorNormalize(const std::vector<Num>& values)
  {
    const Num norm = euclideanNorm(values);
    std::vector<Num> normalized;
    normalized.reserve(values.size());

    for (const Num& v : values)
      normalized.push_back(norm == Num(0) ? Num(0) : v / norm);

    return normalized;
  }
}

#endif
