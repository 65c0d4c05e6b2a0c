#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "CategoryMapper.h"
#include "CriteriaAggregator.h"
#include "EntropyWeighting.h"
#include "TopsisRanker.h"
#include "RankingTestData.h"

using namespace abcrank;
using Catch::Approx;

namespace
{
  InventoryItem decisionRow(int id, double criticality, double demand, double supply,
			    double unitCost, double size)
  {
    InventoryItem item;
    item.id = id;
    item.criticalityAgg = criticality;
    item.demandAgg = demand;
    item.supplyAgg = supply;
    item.unitCost = unitCost;
    item.sizeScore = size;
    return item;
  }
}

TEST_CASE("TopsisRanker: closeness coefficient", "[TopsisRanker]")
{
  REQUIRE(closenessCoefficient(1.0, 3.0) == Approx(0.75));
  REQUIRE(closenessCoefficient(0.0, 2.0) == Approx(1.0));
  REQUIRE(closenessCoefficient(2.0, 0.0) == Approx(0.0));
  REQUIRE(closenessCoefficient(0.0, 0.0) == 0.5);
}

TEST_CASE("TopsisRanker: ideal points follow criterion direction", "[TopsisRanker]")
{
  std::vector<InventoryItem> items = {
    decisionRow(1, 0.6, 0.0, 0.8, 3.0, 0.0),
    decisionRow(2, 0.8, 0.0, 0.6, 4.0, 0.0)
  };

  WeightedDecisionMatrix matrix(items, EntropyWeights::equalWeights());
  const auto criticality = static_cast<std::size_t>(DecisionCriterion::CRITICALITY_AGG);
  const auto supply = static_cast<std::size_t>(DecisionCriterion::SUPPLY_AGG);
  const auto unitCost = static_cast<std::size_t>(DecisionCriterion::UNIT_COST);
  const auto demand = static_cast<std::size_t>(DecisionCriterion::DEMAND_AGG);

  SECTION("Rows are vector normalized and weighted")
    {
      REQUIRE(matrix.getRows()[0][criticality] == Approx(0.6 * 0.2));
      REQUIRE(matrix.getRows()[1][unitCost] == Approx(0.8 * 0.2));
    }

  SECTION("Benefit criterion: best is the maximum")
    {
      REQUIRE(matrix.getIdealBest()[criticality] == Approx(0.8 * 0.2));
      REQUIRE(matrix.getIdealWorst()[criticality] == Approx(0.6 * 0.2));
    }

  SECTION("Cost criteria: best is the minimum")
    {
      REQUIRE(matrix.getIdealBest()[supply] == Approx(0.6 * 0.2));
      REQUIRE(matrix.getIdealWorst()[supply] == Approx(0.8 * 0.2));
      REQUIRE(matrix.getIdealBest()[unitCost] == Approx(0.6 * 0.2));
      REQUIRE(matrix.getIdealWorst()[unitCost] == Approx(0.8 * 0.2));
    }

  SECTION("A zero column normalizes to zero")
    {
      REQUIRE(matrix.getRows()[0][demand] == 0.0);
      REQUIRE(matrix.getIdealBest()[demand] == 0.0);
    }
}

TEST_CASE("TopsisRanker: scores", "[TopsisRanker]")
{
  SECTION("A dominating item scores one and a dominated item zero")
    {
      std::vector<InventoryItem> items = {
	decisionRow(1, 1.0, 1.0, 0.0, 1.0, 1.0),
	decisionRow(2, 0.5, 0.5, 0.5, 3.0, 0.5),
	decisionRow(3, 0.0, 0.0, 1.0, 5.0, 0.0)
      };

      std::vector<InventoryItem> ranked = calculateTOPSIS(items, EntropyWeights::equalWeights());

      REQUIRE(*ranked[0].topsisScore == Approx(1.0));
      REQUIRE(*ranked[2].topsisScore == Approx(0.0));
      REQUIRE(*ranked[1].topsisScore > 0.0);
      REQUIRE(*ranked[1].topsisScore < 1.0);
    }

  SECTION("Identical items all score one half")
    {
      std::vector<InventoryItem> items = {
	decisionRow(1, 0.3, 0.4, 0.5, 10.0, 0.13),
	decisionRow(2, 0.3, 0.4, 0.5, 10.0, 0.13)
      };

      std::vector<InventoryItem> ranked = calculateTOPSIS(items, EntropyWeights::equalWeights());

      REQUIRE(*ranked[0].topsisScore == 0.5);
      REQUIRE(*ranked[1].topsisScore == 0.5);
    }

  SECTION("Scores lie in [0, 1] and items keep input order")
    {
      std::vector<InventoryItem> aggregated =
	calculateAggregations(applyMappings(test::createSampleInventory(), createDefaultMappingTable()),
			      AggregationWeights());

      std::vector<InventoryItem> ranked = calculateTOPSIS(aggregated, calculateEntropyWeights(aggregated));

      REQUIRE(ranked.size() == aggregated.size());
      for (std::size_t i = 0; i < ranked.size(); ++i)
	{
	  REQUIRE(ranked[i].id == aggregated[i].id);
	  REQUIRE(ranked[i].topsisScore.has_value());
	  REQUIRE(*ranked[i].topsisScore >= 0.0);
	  REQUIRE(*ranked[i].topsisScore <= 1.0);
	  REQUIRE_FALSE(aggregated[i].topsisScore.has_value());
	}
    }

  SECTION("Lower unit cost ranks higher when all else is equal")
    {
      std::vector<InventoryItem> items = {
	decisionRow(1, 0.5, 0.5, 0.5, 9.0, 0.5),
	decisionRow(2, 0.5, 0.5, 0.5, 2.0, 0.5),
	decisionRow(3, 0.4, 0.6, 0.5, 5.0, 0.3)
      };

      std::vector<InventoryItem> ranked = calculateTOPSIS(items, EntropyWeights::equalWeights());

      REQUIRE(*ranked[1].topsisScore > *ranked[0].topsisScore);
    }

  SECTION("Empty input")
    {
      REQUIRE(calculateTOPSIS(std::vector<InventoryItem>(), EntropyWeights::equalWeights()).empty());
    }
}
