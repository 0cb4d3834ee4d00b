// SampleStatisticsTest.cpp
//
// Unit tests for SampleStatistics: mean, (n - 1) variance, median and
// linearly interpolated quantiles.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

using namespace methcomp;
using Catch::Approx;

TEST_CASE("SampleStatistics: moments", "[SampleStatistics][moments]")
{
    const std::vector<double> d{0.1, 0.0, 0.2, -0.1, 0.3};

    REQUIRE(SampleStatistics::mean(d) == Approx(0.1).margin(1e-12));
    REQUIRE(SampleStatistics::sampleVariance(d) == Approx(0.025).margin(1e-12));
    REQUIRE(SampleStatistics::sampleStandardDeviation(d) == Approx(std::sqrt(0.025)).margin(1e-12));

    SECTION("constant data has zero spread")
    {
        const std::vector<double> c(7, 4.25);
        REQUIRE(SampleStatistics::mean(c) == Approx(4.25));
        REQUIRE(SampleStatistics::sampleStandardDeviation(c) == Approx(0.0).margin(1e-12));
    }

    SECTION("too few values")
    {
        REQUIRE_THROWS_AS(SampleStatistics::mean(std::vector<double>{}), InsufficientDataException);
        REQUIRE_THROWS_AS(SampleStatistics::sampleVariance(std::vector<double>{1.0}), InsufficientDataException);
    }
}

TEST_CASE("SampleStatistics: median", "[SampleStatistics][median]")
{
    REQUIRE(SampleStatistics::median({5.0, 1.0, 3.0}) == 3.0);
    REQUIRE(SampleStatistics::median({4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
    REQUIRE(SampleStatistics::median({-2.0}) == -2.0);
}

TEST_CASE("SampleStatistics: quantiles interpolate between order statistics", "[SampleStatistics][quantile]")
{
    const std::vector<double> sorted{1.0, 2.0, 3.0, 4.0, 5.0};

    REQUIRE(SampleStatistics::quantileOfSorted(sorted, 0.0) == 1.0);
    REQUIRE(SampleStatistics::quantileOfSorted(sorted, 1.0) == 5.0);
    REQUIRE(SampleStatistics::quantileOfSorted(sorted, 0.5) == Approx(3.0));
    REQUIRE(SampleStatistics::quantileOfSorted(sorted, 0.1) == Approx(1.4));
    REQUIRE(SampleStatistics::quantileOfSorted(sorted, 0.875) == Approx(4.5));

    REQUIRE(SampleStatistics::quantileOfSorted({7.0}, 0.3) == 7.0);
    REQUIRE_THROWS_AS(SampleStatistics::quantileOfSorted(sorted, 1.01), InvalidParameterException);

    SECTION("unsorted input to quantiles")
    {
        const auto q = SampleStatistics::quantiles({5.0, 3.0, 1.0, 4.0, 2.0}, {0.0, 0.25, 1.0});
        REQUIRE(q.size() == 3);
        REQUIRE(q[0] == 1.0);
        REQUIRE(q[1] == Approx(2.0));
        REQUIRE(q[2] == 5.0);
    }
}
