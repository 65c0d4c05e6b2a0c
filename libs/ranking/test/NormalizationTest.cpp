#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "Normalization.h"

using namespace abcrank;
using Catch::Approx;

TEST_CASE("Normalization: min-max scaling", "[Normalization]")
{
  SECTION("Increasing series spans [0, 1]")
    {
      std::vector<double> normalized = minMaxNormalize(std::vector<double>{1.0, 2.0, 3.0, 4.0});

      REQUIRE(normalized.size() == 4);
      REQUIRE(normalized[0] == Approx(0.0));
      REQUIRE(normalized[1] == Approx(1.0 / 3.0));
      REQUIRE(normalized[2] == Approx(2.0 / 3.0));
      REQUIRE(normalized[3] == Approx(1.0));
    }

  SECTION("Negative values are handled")
    {
      std::vector<double> normalized = minMaxNormalize(std::vector<double>{-2.0, 0.0, 2.0});

      REQUIRE(normalized[0] == Approx(0.0));
      REQUIRE(normalized[1] == Approx(0.5));
      REQUIRE(normalized[2] == Approx(1.0));
    }

  SECTION("Constant series maps to exactly one half")
    {
      std::vector<double> normalized = minMaxNormalize(std::vector<double>{5.0, 5.0, 5.0});

      REQUIRE(normalized.size() == 3);
      for (double v : normalized)
	REQUIRE(v == 0.5);
    }

  SECTION("Single element maps to one half")
    {
      std::vector<double> normalized = minMaxNormalize(std::vector<double>{7.0});

      REQUIRE(normalized.size() == 1);
      REQUIRE(normalized[0] == 0.5);
    }

  SECTION("Empty series stays empty")
    {
      REQUIRE(minMaxNormalize(std::vector<double>()).empty());
    }

  SECTION("Output order follows input order")
    {
      std::vector<double> normalized = minMaxNormalize(std::vector<double>{10.0, 0.0, 5.0});

      REQUIRE(normalized[0] == Approx(1.0));
      REQUIRE(normalized[1] == Approx(0.0));
      REQUIRE(normalized[2] == Approx(0.5));
    }
}

TEST_CASE("Normalization: vector normalization", "[Normalization]")
{
  SECTION("Euclidean norm")
    {
      REQUIRE(euclideanNorm(std::vector<double>{3.0, 4.0}) == Approx(5.0));
      REQUIRE(euclideanNorm(std::vector<double>()) == 0.0);
    }

  SECTION("Each entry is divided by the norm")
    {
      std::vector<double> normalized = vectorNormalize(std::vector<double>{3.0, 4.0});

      REQUIRE(normalized[0] == Approx(0.6));
      REQUIRE(normalized[1] == Approx(0.8));
    }

  SECTION("Zero column stays zero")
    {
      std::vector<double> normalized = vectorNormalize(std::vector<double>{0.0, 0.0, 0.0});

      REQUIRE(normalized.size() == 3);
      for (double v : normalized)
	REQUIRE(v == 0.0);
    }
}
