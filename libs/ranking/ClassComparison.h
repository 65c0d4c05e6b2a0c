// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __CLASS_COMPARISON_H
#define __CLASS_COMPARISON_H 1

#include <array>
#include <cstddef>
#include <optional>
#include <vector>
#include "InventoryItem.h"
#include "AbcClassifier.h"

namespace abcrank
{
  /**
   * @brief Population of each ABC class for one score field. Items
   * without a class for that field are counted in unclassified.
   */
  class ClassSummary
  {
  public:
    ClassSummary()
      : mCounts{{0, 0, 0}},
	mUnclassified(0)
    {}

    void addItem(const std::optional<AbcClass>& abcClass);

    std::size_t getCount(AbcClass abcClass) const { return mCounts[abcClassIndex(abcClass)]; }
    std::size_t getUnclassified() const { return mUnclassified; }
    std::size_t getTotal() const;

    /**
     * @brief Share of all items in the class, in [0, 1]; 0 when there are
     * no items.
     */
    double getShare(AbcClass abcClass) const;

  private:
    std::array<std::size_t, 3> mCounts;
    std::size_t mUnclassified;
  };

  ClassSummary summarizeClasses(const std::vector<InventoryItem>& items, ScoreField scoreField);

  struct ClassChange
  {
    int id = 0;
    double topsisScore = 0.0;
    double fuzzyTopsisScore = 0.0;
    AbcClass crispClass = AbcClass::C;
    AbcClass fuzzyClass = AbcClass::C;
  };

  /**
   * @brief Crisp against fuzzy classification of the same items.
   *
   * changeMatrix[crisp][fuzzy] counts items per (crisp class, fuzzy class)
   * pair, indexed with abcClassIndex. Only items that carry both classes
   * take part.
   */
  struct ClassificationComparison
  {
    std::array<std::array<std::size_t, 3>, 3> changeMatrix = {{{{0, 0, 0}}, {{0, 0, 0}}, {{0, 0, 0}}}};
    std::size_t comparedItems = 0;
    std::size_t agreements = 0;
    double agreementRate = 0.0;
    double meanAbsoluteScoreDifference = 0.0;
    std::vector<ClassChange> changes;
  };

  /**
   * @brief Builds the class change matrix and agreement figures. Changed
   * items are listed in the order they appear in items.
   */
  ClassificationComparison compareClassifications(const std::vector<InventoryItem>& items);

  /**
   * @brief The count best items by the given score, highest first. Ties
   * keep input order.
   */
  std::vector<InventoryItem> topRanked(const std::vector<InventoryItem>& items,
				       ScoreField scoreField,
				       std::size_t count);
}

#endif
