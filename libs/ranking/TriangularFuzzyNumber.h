// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIANGULAR_FUZZY_NUMBER_H
#define __TRIANGULAR_FUZZY_NUMBER_H 1

namespace abcrank
{
  /**
   * @brief Triangular fuzzy number (lower, modal, upper).
   *
   * Ratings used by the fuzzy track satisfy 0 <= l <= m <= u <= 1. The
   * type itself does not enforce it; configuration readers check it with
   * isWellFormed().
   */
  class TriangularFuzzyNumber
  {
  public:
    TriangularFuzzyNumber()
      : mLower(0.0),
	mModal(0.0),
	mUpper(0.0)
    {}

    TriangularFuzzyNumber(double lower, double modal, double upper)
      : mLower(lower),
	mModal(modal),
	mUpper(upper)
    {}

    /**
     * @brief Degenerate TFN (l = m = u) carrying a crisp value.
     */
    static TriangularFuzzyNumber crisp(double value)
    {
      return TriangularFuzzyNumber(value, value, value);
    }

    double getLower() const { return mLower; }
    double getModal() const { return mModal; }
    double getUpper() const { return mUpper; }

    TriangularFuzzyNumber scaled(double weight) const
    {
      return TriangularFuzzyNumber(mLower * weight, mModal * weight, mUpper * weight);
    }

    bool isWellFormed() const
    {
      return (0.0 <= mLower) && (mLower <= mModal) && (mModal <= mUpper) && (mUpper <= 1.0);
    }

    bool operator==(const TriangularFuzzyNumber& rhs) const
    {
      return mLower == rhs.mLower && mModal == rhs.mModal && mUpper == rhs.mUpper;
    }

    bool operator!=(const TriangularFuzzyNumber& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    double mLower;
    double mModal;
    double mUpper;
  };

  /**
   * @brief Squared vertex distance between two TFNs:
   * d^2 = ((l1-l2)^2 + (m1-m2)^2 + (u1-u2)^2) / 3
   */
  inline double vertexDistanceSquared(const TriangularFuzzyNumber& a,
				      const TriangularFuzzyNumber& b)
  {
    const double dl = a.getLower() - b.getLower();
    const double dm = a.getModal() - b.getModal();
    const double du = a.getUpper() - b.getUpper();

    return (dl * dl + dm * dm + du * du) / 3.0;
  }
}

#endif
