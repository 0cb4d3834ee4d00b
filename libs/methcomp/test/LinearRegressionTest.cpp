// LinearRegressionTest.cpp
//
// Unit tests for ordinary least squares of method 2 on method 1.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "LinearRegression.h"
#include "MethodComparison.h"
#include "MethodComparisonException.h"

using namespace methcomp;
using Catch::Approx;

TEST_CASE("LinearRegression: exact line is recovered", "[LinearRegression]")
{
    std::vector<double> x;
    std::vector<double> y;
    for (int i = 0; i < 12; ++i)
    {
        x.push_back(0.5 * i);
        y.push_back(3.0 * 0.5 * i - 2.0);
    }

    const auto result = linearRegression(x, y);
    REQUIRE(result.getSlope() == Approx(3.0).margin(1e-12));
    REQUIRE(result.getIntercept() == Approx(-2.0).margin(1e-12));
    REQUIRE(result.getResidualStandardError() == Approx(0.0).margin(1e-9));
    REQUIRE(result.getSlopeConfidenceInterval().width() == Approx(0.0).margin(1e-8));
    REQUIRE(result.getSampleSize() == 12);
}

TEST_CASE("LinearRegression: worked example", "[LinearRegression]")
{
    const auto result = linearRegression({1.0, 2.0, 3.0, 4.0, 5.0}, {1.1, 2.0, 3.2, 3.9, 5.3});

    REQUIRE(result.getSlope() == Approx(1.03).margin(1e-12));
    REQUIRE(result.getIntercept() == Approx(0.01).margin(1e-12));
    REQUIRE(result.getSlopeStandardError() == Approx(0.055075705472861065).epsilon(1e-9));
    REQUIRE(result.getInterceptStandardError() == Approx(0.1826654501176036).epsilon(1e-9));
    REQUIRE(result.getResidualStandardError() == Approx(0.1741646730348419).epsilon(1e-9));

    // t_{0.975, 3}
    const double t = 3.182446305284263;
    REQUIRE(result.getSlopeConfidenceInterval().getLower() ==
            Approx(1.03 - t * 0.055075705472861065).epsilon(1e-7));
    REQUIRE(result.getSlopeConfidenceInterval().getUpper() ==
            Approx(1.03 + t * 0.055075705472861065).epsilon(1e-7));
    REQUIRE(result.getInterceptConfidenceInterval().contains(0.0));
}

TEST_CASE("LinearRegression: failures", "[LinearRegression][errors]")
{
    REQUIRE_THROWS_AS(linearRegression({1.0, 2.0}, {1.0, 2.0}), InsufficientDataException);
    REQUIRE_THROWS_AS(linearRegression({2.0, 2.0, 2.0}, {1.0, 2.0, 3.0}), DegenerateRegressionException);
    REQUIRE_THROWS_AS(LinearRegression().fit(MeasurementSeries({1.0, 2.0}, {1.0, 3.0})), InsufficientDataException);

    LinearRegressionOptions options;
    options.confidenceLevel = 2.0;
    REQUIRE_THROWS_AS(LinearRegression(options), InvalidParameterException);
}
