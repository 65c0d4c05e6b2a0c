#include <catch2/catch_test_macros.hpp>
#include "AbcClassifier.h"
#include "RankingTestData.h"

using namespace abcrank;

namespace
{
  std::vector<InventoryItem> tenScoredItems()
  {
    std::vector<InventoryItem> items;
    const double scores[] = { 0.31, 0.92, 0.15, 0.78, 0.44, 0.05, 0.67, 0.23, 0.59, 0.88 };

    for (int i = 0; i < 10; ++i)
      items.push_back(test::makeScoredItem(i + 1, scores[i], 1.0 - scores[i]));

    return items;
  }

  std::size_t countClass(const std::vector<InventoryItem>& items, AbcClass abcClass)
  {
    std::size_t count = 0;
    for (const auto& item : items)
      if (item.abcClass == abcClass)
	++count;

    return count;
  }
}

TEST_CASE("AbcClassifier: default thresholds", "[AbcClassifier]")
{
  std::vector<InventoryItem> ranked = classifyABC(tenScoredItems(), AbcThresholds());

  SECTION("Ten items split 2 / 3 / 5")
    {
      REQUIRE(ranked.size() == 10);
      REQUIRE(countClass(ranked, AbcClass::A) == 2);
      REQUIRE(countClass(ranked, AbcClass::B) == 3);
      REQUIRE(countClass(ranked, AbcClass::C) == 5);
    }

  SECTION("Items come back sorted by score, highest first")
    {
      for (std::size_t i = 1; i < ranked.size(); ++i)
	REQUIRE(*ranked[i - 1].topsisScore >= *ranked[i].topsisScore);

      REQUIRE(ranked[0].id == 2);
      REQUIRE(ranked[1].id == 10);
      REQUIRE(ranked[9].id == 6);
    }

  SECTION("Classes follow rank position")
    {
      REQUIRE(ranked[0].abcClass == AbcClass::A);
      REQUIRE(ranked[1].abcClass == AbcClass::A);
      REQUIRE(ranked[2].abcClass == AbcClass::B);
      REQUIRE(ranked[4].abcClass == AbcClass::B);
      REQUIRE(ranked[5].abcClass == AbcClass::C);
      REQUIRE(ranked[9].abcClass == AbcClass::C);
    }

  SECTION("The fuzzy class is not touched")
    {
      for (const auto& item : ranked)
	REQUIRE_FALSE(item.fuzzyAbcClass.has_value());
    }

  SECTION("Classifying again changes nothing")
    {
      std::vector<InventoryItem> again = classifyABC(ranked, AbcThresholds());
      for (std::size_t i = 0; i < ranked.size(); ++i)
	{
	  REQUIRE(again[i].id == ranked[i].id);
	  REQUIRE(again[i].abcClass == ranked[i].abcClass);
	}
    }
}

TEST_CASE("AbcClassifier: fuzzy score field", "[AbcClassifier]")
{
  std::vector<InventoryItem> ranked =
    classifyABC(tenScoredItems(), AbcThresholds(), ScoreField::FUZZY_TOPSIS_SCORE);

  REQUIRE(ranked[0].id == 6);
  REQUIRE(ranked[0].fuzzyAbcClass == AbcClass::A);
  REQUIRE(ranked[9].fuzzyAbcClass == AbcClass::C);
  for (const auto& item : ranked)
    REQUIRE_FALSE(item.abcClass.has_value());
}

TEST_CASE("AbcClassifier: ties and thresholds", "[AbcClassifier]")
{
  SECTION("Equal scores keep input order")
    {
      std::vector<InventoryItem> items = {
	test::makeScoredItem(4, 0.5, 0.0),
	test::makeScoredItem(1, 0.9, 0.0),
	test::makeScoredItem(3, 0.5, 0.0),
	test::makeScoredItem(2, 0.5, 0.0)
      };

      std::vector<InventoryItem> ranked = classifyABC(items, AbcThresholds());

      REQUIRE(ranked[0].id == 1);
      REQUIRE(ranked[1].id == 4);
      REQUIRE(ranked[2].id == 3);
      REQUIRE(ranked[3].id == 2);
    }

  SECTION("Small populations floor the cut points")
    {
      // idxA = floor(0.6) = 0, idxB = floor(1.5) = 1
      std::vector<InventoryItem> ranked = classifyABC({
	  test::makeScoredItem(1, 0.9, 0.0),
	  test::makeScoredItem(2, 0.5, 0.0),
	  test::makeScoredItem(3, 0.1, 0.0)
	}, AbcThresholds());

      REQUIRE(ranked[0].abcClass == AbcClass::B);
      REQUIRE(ranked[1].abcClass == AbcClass::C);
      REQUIRE(ranked[2].abcClass == AbcClass::C);
    }

  SECTION("Thresholds past one hundred leave no C items")
    {
      AbcThresholds thresholds;
      thresholds.a = 50.0;
      thresholds.b = 80.0;

      std::vector<InventoryItem> ranked = classifyABC(tenScoredItems(), thresholds);

      REQUIRE(countClass(ranked, AbcClass::A) == 5);
      REQUIRE(countClass(ranked, AbcClass::B) == 5);
      REQUIRE(countClass(ranked, AbcClass::C) == 0);
    }

  SECTION("Cut points are clamped to the population")
    {
      AbcThresholds thresholds;
      thresholds.a = 150.0;
      thresholds.b = 0.0;

      AbcCutPoints cutPoints(4, thresholds);
      REQUIRE(cutPoints.getClassBStart() == 4);
      REQUIRE(cutPoints.getClassCStart() == 4);

      thresholds.a = -10.0;
      AbcCutPoints negative(4, thresholds);
      REQUIRE(negative.getClassBStart() == 0);
      REQUIRE(negative.classAt(0) == AbcClass::C);
    }

  SECTION("Missing scores sort as zero")
    {
      InventoryItem unscored;
      unscored.id = 9;

      std::vector<InventoryItem> ranked = classifyABC({
	  unscored,
	  test::makeScoredItem(1, 0.2, 0.0)
	}, AbcThresholds());

      REQUIRE(ranked[0].id == 1);
      REQUIRE(ranked[1].id == 9);
    }

  SECTION("Empty input")
    {
      REQUIRE(classifyABC(std::vector<InventoryItem>(), AbcThresholds()).empty());
    }
}

TEST_CASE("AbcClassifier: classes by input position", "[AbcClassifier]")
{
  std::vector<InventoryItem> items = tenScoredItems();
  for (auto& item : items)
    item.id = 0;

  SECTION("Entry i is the class of the i-th item, ids are not used")
    {
      // Fuzzy scores are 1 - crisp: 0.95 and 0.85 are A, 0.77, 0.69 and 0.56 are B
      const std::vector<AbcClass> expected = {
	AbcClass::B, AbcClass::C, AbcClass::A, AbcClass::C, AbcClass::B,
	AbcClass::A, AbcClass::C, AbcClass::B, AbcClass::C, AbcClass::C
      };

      REQUIRE(abcClassesByPosition(items, AbcThresholds(), ScoreField::FUZZY_TOPSIS_SCORE) == expected);
    }

  SECTION("Agrees with classifyABC item by item")
    {
      const std::vector<InventoryItem> withIds = tenScoredItems();
      const std::vector<AbcClass> classes =
	abcClassesByPosition(withIds, AbcThresholds(), ScoreField::TOPSIS_SCORE);
      const std::vector<InventoryItem> ranked = classifyABC(withIds, AbcThresholds());

      for (const auto& item : ranked)
	REQUIRE(item.abcClass == classes[static_cast<std::size_t>(item.id - 1)]);
    }

  SECTION("Empty input")
    {
      REQUIRE(abcClassesByPosition(std::vector<InventoryItem>(), AbcThresholds(),
				   ScoreField::TOPSIS_SCORE).empty());
    }
}
