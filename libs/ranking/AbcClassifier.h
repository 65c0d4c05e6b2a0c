// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ABC_CLASSIFIER_H
#define __ABC_CLASSIFIER_H 1

#include <cstddef>
#include <vector>
#include "InventoryItem.h"
#include "RankingConfiguration.h"

namespace abcrank
{
  enum class ScoreField
  {
    TOPSIS_SCORE,
    FUZZY_TOPSIS_SCORE
  };

  /**
   * @brief Rank positions at which class B and class C start.
   *
   * idxA = floor(n * A / 100) and idxB = floor(n * (A + B) / 100), both
   * clamped to [0, n] so thresholds summing past 100 cannot index beyond
   * the item set.
   */
  class AbcCutPoints
  {
  public:
    AbcCutPoints(std::size_t numItems, const AbcThresholds& thresholds);

    std::size_t getClassBStart() const { return mClassBStart; }
    std::size_t getClassCStart() const { return mClassCStart; }

    AbcClass classAt(std::size_t rankPosition) const;

  private:
    static std::size_t clampedIndex(double index, std::size_t numItems);

  private:
    std::size_t mClassBStart;
    std::size_t mClassCStart;
  };

  /**
   * @brief Sorts items by the chosen score, highest first, and assigns
   * ABC classes by rank position.
   *
   * The sort is stable: equal scores keep their input order. Missing
   * scores sort as zero. The class is written to abcClass for
   * TOPSIS_SCORE and to fuzzyAbcClass for FUZZY_TOPSIS_SCORE; the other
   * field is left untouched.
   *
   * @return The items in rank order.
   */
  std::vector<InventoryItem> classifyABC(const std::vector<InventoryItem>& items,
					 const AbcThresholds& thresholds,
					 ScoreField scoreField = ScoreField::TOPSIS_SCORE);

  /**
   * @brief The classes classifyABC would assign, returned by input
   * position rather than in rank order. Entry i is the class of items[i];
   * item ids are not consulted.
   */
  std::vector<AbcClass> abcClassesByPosition(const std::vector<InventoryItem>& items,
					     const AbcThresholds& thresholds,
					     ScoreField scoreField);
}

#endif
