#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "CategoryMapper.h"
#include "CriteriaAggregator.h"
#include "RankingTestData.h"

using namespace abcrank;
using Catch::Approx;

namespace
{
  std::vector<InventoryItem> mappedPair()
  {
    std::vector<InventoryItem> items = {
      test::makeItem(1, "High", "Stable", 10.0, 1.0, 99.0, 2, "No", "Large"),
      test::makeItem(2, "Low", "Ending", 30.0, 5.0, 1.0, 10, "Yes", "Small")
    };

    return applyMappings(items, createDefaultMappingTable());
  }
}

TEST_CASE("CriteriaAggregator: default weights", "[CriteriaAggregator]")
{
  std::vector<InventoryItem> aggregated = calculateAggregations(mappedPair(), AggregationWeights());

  REQUIRE(aggregated.size() == 2);

  SECTION("Criticality combines risk and fluctuation scores")
    {
      REQUIRE(*aggregated[0].criticalityAgg == Approx(0.78 * 0.47 + 0.22 * 0.28));
      REQUIRE(*aggregated[1].criticalityAgg == Approx(0.78 * 0.18));
    }

  SECTION("Demand uses normalized daily usage and average stock")
    {
      REQUIRE(*aggregated[0].demandAgg == Approx(0.0));
      REQUIRE(*aggregated[1].demandAgg == Approx(1.0));
    }

  SECTION("Supply uses normalized lead time and consignment score")
    {
      REQUIRE(*aggregated[0].supplyAgg == Approx(0.25 * 0.80));
      REQUIRE(*aggregated[1].supplyAgg == Approx(0.75 + 0.25 * 0.20));
    }

  SECTION("Unit cost is left as imported")
    {
      REQUIRE(aggregated[0].unitCost == 99.0);
      REQUIRE(aggregated[1].unitCost == 1.0);
    }
}

TEST_CASE("CriteriaAggregator: edge cases", "[CriteriaAggregator]")
{
  SECTION("Constant quantitative columns contribute one half")
    {
      std::vector<InventoryItem> items = applyMappings({
	  test::makeItem(1, "High", "Stable", 4.0, 2.0, 1.0, 3, "No", "Large"),
	  test::makeItem(2, "Low", "Stable", 4.0, 2.0, 1.0, 3, "No", "Large")
	}, createDefaultMappingTable());

      std::vector<InventoryItem> aggregated = calculateAggregations(items, AggregationWeights());

      REQUIRE(*aggregated[0].demandAgg == Approx(0.71 * 0.5 + 0.29 * 0.5));
      REQUIRE(*aggregated[1].supplyAgg == Approx(0.75 * 0.5 + 0.25 * 0.80));
    }

  SECTION("Weights not summing to one are applied without clamping")
    {
      AggregationWeights weights;
      weights.demand.dailyUsage = 2.0;
      weights.demand.averageStock = 1.0;

      std::vector<InventoryItem> aggregated = calculateAggregations(mappedPair(), weights);

      REQUIRE(*aggregated[1].demandAgg == Approx(3.0));
    }

  SECTION("Unmapped items aggregate with zero scores")
    {
      std::vector<InventoryItem> items = {
	test::makeItem(1, "High", "Stable", 1.0, 1.0, 1.0, 1, "No", "Large")
      };

      std::vector<InventoryItem> aggregated = calculateAggregations(items, AggregationWeights());

      REQUIRE(*aggregated[0].criticalityAgg == 0.0);
      REQUIRE(*aggregated[0].supplyAgg == Approx(0.75 * 0.5));
    }

  SECTION("Empty input")
    {
      REQUIRE(calculateAggregations(std::vector<InventoryItem>(), AggregationWeights()).empty());
    }
}
