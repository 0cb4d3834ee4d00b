// MountainAnalyzerTest.cpp
//
// Unit tests for MountainAnalyzer (folded empirical CDF of x - y).

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "MethodComparison.h"
#include "MethodComparisonException.h"
#include "MountainAnalyzer.h"

using namespace methcomp;
using Catch::Approx;

TEST_CASE("MountainAnalyzer: worked example with five steps", "[Mountain]")
{
    MountainOptions options;
    options.percentileSteps = 5;
    options.centralRangePercent = 50.0;

    // differences x - y: -0.1, 0.0, -0.2, 0.1, -0.3
    const auto result = mountain({1.0, 2.0, 3.0, 4.0, 5.0}, {1.1, 2.0, 3.2, 3.9, 5.3}, options);

    const std::vector<double> expectedQuantiles{-0.3, -0.2, -0.1, 0.0, 0.1};
    const std::vector<double> expectedFolded{0.0, 25.0, 50.0, 25.0, 0.0};

    REQUIRE(result.getQuantiles().size() == 5);
    for (std::size_t k = 0; k < 5; ++k)
    {
        REQUIRE(result.getProbabilities()[k] == Approx(0.25 * static_cast<double>(k)));
        REQUIRE(result.getQuantiles()[k] == Approx(expectedQuantiles[k]).margin(1e-12));
        REQUIRE(result.getFoldedCdf()[k] == Approx(expectedFolded[k]).margin(1e-12));
    }

    REQUIRE(result.getAreaUnderCurve() == Approx(10.0).margin(1e-9));
    REQUIRE(result.getMedianIndex() == 2);
    REQUIRE(result.getMedian() == Approx(-0.1).margin(1e-12));
    REQUIRE(result.getCentralRangeLower() == Approx(-0.2).margin(1e-12));
    REQUIRE(result.getCentralRangeUpper() == Approx(0.0).margin(1e-12));
    REQUIRE(result.getCentralRangeIndices().first == 1);
    REQUIRE(result.getCentralRangeIndices().second == 3);
}

TEST_CASE("MountainAnalyzer: constant differences", "[Mountain]")
{
    const std::vector<double> x{10.0, 20.0, 30.0, 40.0};
    const std::vector<double> y{12.5, 22.5, 32.5, 42.5};
    const auto result = mountain(x, y);

    REQUIRE(result.getQuantiles().size() == 100);
    REQUIRE(result.getAreaUnderCurve() == Approx(0.0).margin(1e-12));
    REQUIRE(result.getMedian() == Approx(-2.5));
    REQUIRE(result.getCentralRangeLower() == Approx(-2.5));
    REQUIRE(result.getCentralRangeUpper() == Approx(-2.5));
    REQUIRE(result.getCentralRangePercent() == Approx(68.27));
}

TEST_CASE("MountainAnalyzer: differences are method 1 minus method 2", "[Mountain]")
{
    const auto result = mountain({1.0, 2.0, 3.0, 4.0}, {2.0, 3.0, 4.0, 5.0});
    REQUIRE(result.getMedian() == Approx(-1.0));
    REQUIRE(result.getQuantiles().front() == Approx(-1.0));
    REQUIRE(result.getQuantiles().back() == Approx(-1.0));

    const auto reversed = mountain({2.0, 3.0, 4.0, 5.0}, {1.0, 2.0, 3.0, 4.0});
    REQUIRE(reversed.getMedian() == Approx(1.0));
}

TEST_CASE("MountainAnalyzer: folded CDF shape", "[Mountain]")
{
    const auto result = mountain({0.0, 0.0, 0.0, 0.0, 0.0, 0.0}, {-2.0, 1.5, 0.3, 4.0, -0.7, 2.2});
    const auto& folded = result.getFoldedCdf();
    const auto& quantiles = result.getQuantiles();

    REQUIRE(folded.front() == 0.0);
    REQUIRE(folded.back() == Approx(0.0).margin(1e-12));
    for (double m : folded)
    {
        REQUIRE(m >= 0.0);
        REQUIRE(m <= 50.0);
    }
    for (std::size_t k = 1; k < quantiles.size(); ++k)
        REQUIRE(quantiles[k - 1] <= quantiles[k]);

    REQUIRE(result.getAreaUnderCurve() > 0.0);
    REQUIRE(result.getCentralRangeLower() <= result.getMedian());
    REQUIRE(result.getMedian() <= result.getCentralRangeUpper());
}

TEST_CASE("MountainAnalyzer: single step", "[Mountain]")
{
    MountainOptions options;
    options.percentileSteps = 1;
    const auto result = mountain({1.0, 2.0}, {3.0, 2.0}, options);

    REQUIRE(result.getProbabilities() == std::vector<double>{0.0});
    REQUIRE(result.getMedianIndex() == 0);
    REQUIRE(result.getAreaUnderCurve() == 0.0);
    REQUIRE(result.getCentralRangeIndices().first == 0);
    REQUIRE(result.getCentralRangeIndices().second == 0);
}

TEST_CASE("MountainAnalyzer: invalid options", "[Mountain][errors]")
{
    MountainOptions options;
    options.percentileSteps = 0;
    REQUIRE_THROWS_AS(MountainAnalyzer(options), InvalidParameterException);

    options = MountainOptions();
    options.centralRangePercent = 120.0;
    REQUIRE_THROWS_AS(MountainAnalyzer(options), InvalidParameterException);

    REQUIRE_THROWS_AS(mountain({1.0, 2.0}, {1.0}), ShapeMismatchException);
}
