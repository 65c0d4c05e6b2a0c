#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "RankingConfigurationReader.h"
#include "TempFile.h"

using namespace abcrank;
using namespace abcrank::io;
using Catch::Approx;

TEST_CASE("RankingConfigurationReader: defaults", "[RankingConfigurationReader]")
{
  SECTION("An empty document keeps every default")
    {
      RankingConfiguration configuration = RankingConfigurationReader::parseConfiguration("{}");

      REQUIRE(configuration.getMappingTable() == createDefaultMappingTable());
      REQUIRE(configuration.getFuzzyNumberTable() == createDefaultFuzzyNumberTable());
      REQUIRE(configuration.getAggregationWeights().criticality.risk == Approx(0.78));
      REQUIRE(configuration.getAggregationWeights().demand.averageStock == Approx(0.29));
      REQUIRE(configuration.getAggregationWeights().supply.leadTime == Approx(0.75));
      REQUIRE(configuration.getAbcThresholds().a == 20.0);
      REQUIRE(configuration.getAbcThresholds().b == 30.0);
      REQUIRE(configuration.getAbcThresholds().c == 50.0);
    }

  SECTION("Default crisp scores")
    {
      MappingTable table = createDefaultMappingTable();
      REQUIRE(table.lookup(QualitativeAttribute::RISK, "Normal") == Approx(0.35));
      REQUIRE(table.lookup(QualitativeAttribute::DEMAND_FLUCTUATION, "Unknown") == Approx(0.20));
      REQUIRE(table.lookup(QualitativeAttribute::DEMAND_FLUCTUATION, "Decreasing") == Approx(0.16));
      REQUIRE(table.lookup(QualitativeAttribute::UNIT_SIZE, "Medium") == Approx(0.31));
    }
}

TEST_CASE("RankingConfigurationReader: overrides", "[RankingConfigurationReader]")
{
  const std::string json = R"({
    "mappings": { "Risk": { "High": 0.5, "Critical": 0.9 } },
    "aggregationWeights": { "Criticality": { "Risk": 0.7, "Fluctuation": 0.3 },
                            "Supply": { "LeadTime": 0.6 } },
    "fuzzyNumbers": { "Unit size": { "Large": [0.5, 0.7, 0.9] } },
    "abcThresholds": { "A": 10, "B": 20, "C": 70 }
  })";

  RankingConfiguration configuration = RankingConfigurationReader::parseConfiguration(json);

  SECTION("A supplied sub-table replaces the default one")
    {
      const MappingTable& table = configuration.getMappingTable();
      REQUIRE(table.lookup(QualitativeAttribute::RISK, "High") == Approx(0.5));
      REQUIRE(table.lookup(QualitativeAttribute::RISK, "Critical") == Approx(0.9));
      REQUIRE(table.lookup(QualitativeAttribute::RISK, "Low") == 0.0);
      REQUIRE(table.getTable(QualitativeAttribute::RISK).size() == 2);
    }

  SECTION("Sub-tables not supplied keep their defaults")
    {
      REQUIRE(configuration.getMappingTable().getTable(QualitativeAttribute::UNIT_SIZE) ==
	      createDefaultMappingTable().getTable(QualitativeAttribute::UNIT_SIZE));
      REQUIRE(configuration.getFuzzyNumberTable().getTable(QualitativeAttribute::RISK) ==
	      createDefaultFuzzyNumberTable().getTable(QualitativeAttribute::RISK));
    }

  SECTION("Fuzzy numbers")
    {
      REQUIRE(configuration.getFuzzyNumberTable().lookup(QualitativeAttribute::UNIT_SIZE, "Large") ==
	      TriangularFuzzyNumber(0.5, 0.7, 0.9));
      REQUIRE(configuration.getFuzzyNumberTable().getTable(QualitativeAttribute::UNIT_SIZE).size() == 1);
    }

  SECTION("Weights override only what they name")
    {
      const AggregationWeights& weights = configuration.getAggregationWeights();
      REQUIRE(weights.criticality.risk == Approx(0.7));
      REQUIRE(weights.criticality.fluctuation == Approx(0.3));
      REQUIRE(weights.supply.leadTime == Approx(0.6));
      REQUIRE(weights.supply.consignment == Approx(0.25));
      REQUIRE(weights.demand.dailyUsage == Approx(0.71));
    }

  SECTION("Thresholds")
    {
      REQUIRE(configuration.getAbcThresholds().a == 10.0);
      REQUIRE(configuration.getAbcThresholds().b == 20.0);
      REQUIRE(configuration.getAbcThresholds().c == 70.0);
    }

  SECTION("Weights that do not sum to one are accepted")
    {
      RankingConfiguration loose = RankingConfigurationReader::parseConfiguration(
	R"({"aggregationWeights": {"Demand": {"DailyUsage": 2.0, "AverageStock": 2.0}}})");
      REQUIRE(loose.getAggregationWeights().demand.dailyUsage == Approx(2.0));
    }
}

TEST_CASE("RankingConfigurationReader: malformed documents", "[RankingConfigurationReader]")
{
  SECTION("Invalid JSON")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration("{ \"mappings\": "),
			RankingConfigurationException);
    }

  SECTION("Top level must be an object")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration("[1, 2]"),
			RankingConfigurationException);
    }

  SECTION("Unknown attribute")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"mappings": {"Colour": {"Red": 0.1}}})"),
			RankingConfigurationException);
    }

  SECTION("Negative score")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"mappings": {"Risk": {"High": -0.1}}})"),
			RankingConfigurationException);
    }

  SECTION("Score must be a number")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"mappings": {"Risk": {"High": "0.4"}}})"),
			RankingConfigurationException);
    }

  SECTION("Fuzzy number out of order")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"fuzzyNumbers": {"Risk": {"High": [0.9, 0.5, 1.0]}}})"),
			RankingConfigurationException);
    }

  SECTION("Fuzzy number with two vertices")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"fuzzyNumbers": {"Risk": {"High": [0.5, 1.0]}}})"),
			RankingConfigurationException);
    }

  SECTION("Negative threshold")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"abcThresholds": {"A": -5}})"),
			RankingConfigurationException);
    }

  SECTION("Weight group must be an object")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader::parseConfiguration(R"({"aggregationWeights": {"Demand": 0.5}})"),
			RankingConfigurationException);
    }
}

TEST_CASE("RankingConfigurationReader: files and serialization", "[RankingConfigurationReader]")
{
  SECTION("Reads a configuration file")
    {
      test::TempFile json(".json", R"({"abcThresholds": {"A": 15, "B": 35, "C": 50}})");

      RankingConfiguration configuration = RankingConfigurationReader(json.getFileName()).readConfigurationFile();
      REQUIRE(configuration.getAbcThresholds().a == 15.0);
      REQUIRE(configuration.getAbcThresholds().b == 35.0);
    }

  SECTION("Missing file")
    {
      REQUIRE_THROWS_AS(RankingConfigurationReader("/nonexistent/abcrank/config.json").readConfigurationFile(),
			RankingConfigurationException);
    }

  SECTION("Serialized configuration reads back unchanged")
    {
      RankingConfiguration original;
      MappingTable mappings = original.getMappingTable();
      mappings.setValue(QualitativeAttribute::UNIT_SIZE, "Pallet", 0.75);
      original.setMappingTable(mappings);

      AggregationWeights weights;
      weights.demand.dailyUsage = 0.6;
      weights.demand.averageStock = 0.4;
      original.setAggregationWeights(weights);

      RankingConfiguration parsed =
	RankingConfigurationReader::parseConfiguration(RankingConfigurationReader::toJson(original));

      REQUIRE(parsed.getMappingTable() == original.getMappingTable());
      REQUIRE(parsed.getFuzzyNumberTable() == original.getFuzzyNumberTable());
      REQUIRE(parsed.getAggregationWeights().demand.dailyUsage == Approx(0.6));
      REQUIRE(parsed.getAggregationWeights().demand.averageStock == Approx(0.4));
      REQUIRE(parsed.getAbcThresholds().c == 50.0);
    }
}
