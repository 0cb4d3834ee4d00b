// ConfidenceIntervalCalculatorTest.cpp
//
// Unit tests for the interval helpers:
//  - Student-t and normal two-sided critical values against tabulated values
//  - the Acklam inverse normal CDF in NormalQuantile.h
//  - clamped rank indexing
//  - ConfidenceInterval ordering

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "ConfidenceInterval.h"
#include "ConfidenceIntervalCalculator.h"
#include "MethodComparisonException.h"
#include "NormalQuantile.h"

using namespace methcomp;
using Catch::Approx;
using methcomp::detail::compute_normal_cdf;
using methcomp::detail::compute_normal_quantile;

TEST_CASE("compute_normal_quantile: standard critical values", "[NormalQuantile]")
{
    REQUIRE(compute_normal_quantile(0.975) == Approx(1.959963984540054).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.025) == Approx(-1.959963984540054).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.995) == Approx(2.575829303548901).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.5) == Approx(0.0).margin(1e-12));

    SECTION("round trip through the CDF")
    {
        for (double p : {0.001, 0.05, 0.3, 0.7, 0.95, 0.999})
            REQUIRE(compute_normal_cdf(compute_normal_quantile(p)) == Approx(p).margin(1e-8));
    }

    SECTION("probabilities outside (0, 1) are rejected")
    {
        REQUIRE_THROWS_AS(compute_normal_quantile(0.0), std::domain_error);
        REQUIRE_THROWS_AS(compute_normal_quantile(1.0), std::domain_error);
    }
}

TEST_CASE("ConfidenceIntervalCalculator: critical values", "[ConfidenceIntervalCalculator][critical]")
{
    SECTION("normal")
    {
        REQUIRE(ConfidenceIntervalCalculator::normalCriticalValue(0.95) == Approx(1.959963984540054).margin(1e-8));
        REQUIRE(ConfidenceIntervalCalculator::normalCriticalValue(0.90) == Approx(1.644853626951472).margin(1e-8));
    }

    SECTION("Student-t matches tables")
    {
        REQUIRE(ConfidenceIntervalCalculator::studentTCriticalValue(1, 0.95) == Approx(12.7062047).epsilon(1e-7));
        REQUIRE(ConfidenceIntervalCalculator::studentTCriticalValue(3, 0.95) == Approx(3.1824463).epsilon(1e-7));
        REQUIRE(ConfidenceIntervalCalculator::studentTCriticalValue(4, 0.95) == Approx(2.7764451).epsilon(1e-7));
        REQUIRE(ConfidenceIntervalCalculator::studentTCriticalValue(10, 0.99) == Approx(3.1692727).epsilon(1e-7));
    }

    SECTION("Student-t approaches the normal value")
    {
        const double t = ConfidenceIntervalCalculator::studentTCriticalValue(100000, 0.95);
        REQUIRE(t == Approx(ConfidenceIntervalCalculator::normalCriticalValue(0.95)).epsilon(1e-4));
        REQUIRE(t > ConfidenceIntervalCalculator::normalCriticalValue(0.95));
    }

    SECTION("invalid arguments")
    {
        REQUIRE_THROWS_AS(ConfidenceIntervalCalculator::studentTCriticalValue(0, 0.95), InvalidParameterException);
        REQUIRE_THROWS_AS(ConfidenceIntervalCalculator::studentTCriticalValue(5, 1.5), InvalidParameterException);
        REQUIRE_THROWS_AS(ConfidenceIntervalCalculator::normalCriticalValue(0.0), InvalidParameterException);
    }
}

TEST_CASE("ConfidenceIntervalCalculator: rankToValue clamps", "[ConfidenceIntervalCalculator][rank]")
{
    const std::vector<double> sorted{1.0, 2.0, 3.0, 4.0};

    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, 1) == 1.0);
    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, 3) == 3.0);
    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, 0) == 1.0);
    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, -7) == 1.0);
    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, 5) == 4.0);
    REQUIRE(ConfidenceIntervalCalculator::rankToValue(sorted, 400) == 4.0);

    REQUIRE_THROWS_AS(ConfidenceIntervalCalculator::rankToValue(std::vector<double>{}, 1), InsufficientDataException);
}

TEST_CASE("ConfidenceInterval: bounds are ordered", "[ConfidenceInterval]")
{
    const ConfidenceInterval ci(2.5, -1.0);
    REQUIRE(ci.getLower() == -1.0);
    REQUIRE(ci.getUpper() == 2.5);
    REQUIRE(ci.width() == Approx(3.5));
    REQUIRE(ci.contains(0.0));
    REQUIRE(ci.contains(2.5));
    REQUIRE_FALSE(ci.contains(2.6));
    REQUIRE(ci == ConfidenceInterval(-1.0, 2.5));

    const auto symmetric = ConfidenceIntervalCalculator::symmetricInterval(10.0, 2.0);
    REQUIRE(symmetric.getLower() == 8.0);
    REQUIRE(symmetric.getUpper() == 12.0);

    std::ostringstream os;
    os << symmetric;
    REQUIRE(os.str() == "[8, 12]");
}
