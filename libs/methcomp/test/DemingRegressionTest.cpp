// DemingRegressionTest.cpp
//
// Unit tests for DemingRegression:
//  - closed-form estimate against hand computed values
//  - recovery of an exact line
//  - bootstrap reproducibility for a fixed seed and independence of the executor
//  - degenerate samples and replicate accounting

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <sstream>
#include <vector>
#include "DemingRegression.h"
#include "MethodComparison.h"
#include "MethodComparisonException.h"
#include "ParallelExecutors.h"

using namespace methcomp;
using Catch::Approx;

namespace
{
    const std::vector<double> kMethod1{1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0};
    const std::vector<double> kMethod2{1.1, 2.0, 3.2, 3.9, 5.3, 5.8, 7.1, 8.2, 8.8, 10.3};
}

TEST_CASE("DemingRegression: closed-form estimate", "[Deming][estimate]")
{
    const MeasurementSeries series({1.0, 2.0, 3.0, 4.0, 5.0}, {1.1, 2.0, 3.2, 3.9, 5.3});

    SECTION("equal error variances")
    {
        const auto estimate = estimateDeming(series, 1.0);
        REQUIRE(estimate.slope == Approx(1.0345577559540322).epsilon(1e-10));
        REQUIRE(estimate.intercept == Approx(-0.003673267862096541).margin(1e-10));
        REQUIRE(estimate.sigmaX == Approx(0.08568849949426094).epsilon(1e-9));
        REQUIRE(estimate.sigmaY == Approx(estimate.sigmaX).epsilon(1e-12));
    }

    SECTION("variance ratio 4")
    {
        const auto estimate = estimateDeming(series, 4.0);
        REQUIRE(estimate.slope == Approx(1.0318546769426027).epsilon(1e-10));
        REQUIRE(estimate.intercept == Approx(0.0044359691721918).margin(1e-10));
        REQUIRE(estimate.sigmaX == Approx(0.05473299868878212).epsilon(1e-9));
        REQUIRE(estimate.sigmaY == Approx(0.10946599737756424).epsilon(1e-9));
    }

    SECTION("zero covariance is degenerate")
    {
        REQUIRE_THROWS_AS(estimateDeming(MeasurementSeries({1.0, 2.0, 3.0}, {5.0, 5.0, 5.0}), 1.0),
                          DegenerateRegressionException);
        REQUIRE_FALSE(detail::computeDemingEstimate({1.0, 2.0, 3.0}, {5.0, 5.0, 5.0}, 1.0).has_value());
    }
}

TEST_CASE("DemingRegression: exact line", "[Deming][exact]")
{
    std::vector<double> y;
    for (double x : kMethod1)
        y.push_back(2.0 * x + 1.0);

    DemingOptions options;
    options.bootstrapReplications = 200;
    const auto result = demingRegression(kMethod1, y, options);

    REQUIRE(result.getSlope() == Approx(2.0).epsilon(1e-12));
    REQUIRE(result.getIntercept() == Approx(1.0).epsilon(1e-12));
    REQUIRE(result.getSigmaX() == Approx(0.0).margin(1e-9));
    REQUIRE(result.hasConfidenceIntervals());
    REQUIRE(result.getSlopeConfidenceInterval()->getLower() == Approx(2.0).epsilon(1e-9));
    REQUIRE(result.getSlopeConfidenceInterval()->getUpper() == Approx(2.0).epsilon(1e-9));
    REQUIRE(*result.getSlopeStandardError() == Approx(0.0).margin(1e-9));
}

TEST_CASE("DemingRegression: bootstrap", "[Deming][bootstrap]")
{
    const MeasurementSeries series(kMethod1, kMethod2);
    DemingOptions options;
    options.bootstrapReplications = 500;
    options.seed = 20240611ull;

    const auto first = DemingRegression<>(options).fit(series);

    SECTION("intervals bracket the full-sample estimate")
    {
        REQUIRE(first.hasConfidenceIntervals());
        REQUIRE(first.getSlopeConfidenceInterval()->contains(first.getSlope()));
        REQUIRE(first.getInterceptConfidenceInterval()->contains(first.getIntercept()));
        REQUIRE(*first.getSlopeStandardError() > 0.0);
        REQUIRE(*first.getInterceptStandardError() > 0.0);
        REQUIRE(first.getUsableReplications() + first.getSkippedReplications() == 500);
    }

    SECTION("a fixed seed reproduces the intervals")
    {
        const auto second = DemingRegression<>(options).fit(series);
        REQUIRE(second.getSlopeConfidenceInterval() == first.getSlopeConfidenceInterval());
        REQUIRE(second.getInterceptConfidenceInterval() == first.getInterceptConfidenceInterval());
        REQUIRE(*second.getSlopeStandardError() == *first.getSlopeStandardError());
    }

    SECTION("a different seed changes the draws but not the point estimate")
    {
        DemingOptions other = options;
        other.seed = options.seed + 1;
        const auto second = DemingRegression<>(other).fit(series);
        REQUIRE(second.getSlope() == first.getSlope());
        REQUIRE(*second.getSlopeStandardError() != *first.getSlopeStandardError());
    }

    SECTION("the executor does not change the bootstrap distribution")
    {
        DemingRegression<concurrency::ThreadPoolExecutor<4>> pooled(options);
        pooled.setChunkSizeHint(7);
        const auto parallel = pooled.fit(series);
        REQUIRE(parallel.getSlopeConfidenceInterval() == first.getSlopeConfidenceInterval());
        REQUIRE(parallel.getInterceptConfidenceInterval() == first.getInterceptConfidenceInterval());
        REQUIRE(parallel.getUsableReplications() == first.getUsableReplications());

        const auto async = DemingRegression<concurrency::StdAsyncExecutor>(options).fit(series);
        REQUIRE(async.getSlopeConfidenceInterval() == first.getSlopeConfidenceInterval());
    }

    SECTION("no replicates means no intervals")
    {
        DemingOptions none = options;
        none.bootstrapReplications = 0;
        const auto result = DemingRegression<>(none).fit(series);
        REQUIRE_FALSE(result.hasConfidenceIntervals());
        REQUIRE_FALSE(result.getSlopeStandardError().has_value());
        REQUIRE(result.getSlope() == first.getSlope());
    }
}

TEST_CASE("DemingRegression: replicate accounting", "[Deming][bootstrap]")
{
    const MeasurementSeries series({1.0, 2.0, 3.0}, {1.0, 2.5, 2.9});
    DemingOptions options;
    options.bootstrapReplications = 10;

    DemingBootstrapSamples samples(10);
    for (std::size_t b = 0; b < 10; ++b)
    {
        samples.slopes[b] = 1.0 + 0.01 * static_cast<double>(b);
        samples.intercepts[b] = 0.1;
        samples.usable[b] = b % 3 != 0;
    }

    const auto estimate = estimateDeming(series, 1.0);

    SECTION("skipped replicates are counted and logged")
    {
        std::ostringstream log;
        options.diagnosticLog = &log;
        const auto result = summarizeDemingBootstrap(series, estimate, samples, options);
        REQUIRE(result.getUsableReplications() == 6);
        REQUIRE(result.getSkippedReplications() == 4);
        REQUIRE(log.str().find("skipped 4 of 10") != std::string::npos);
    }

    SECTION("fewer than half usable is degenerate")
    {
        for (std::size_t b = 0; b < 10; ++b)
            samples.usable[b] = b < 4;
        REQUIRE_THROWS_AS(summarizeDemingBootstrap(series, estimate, samples, options),
                          DegenerateRegressionException);
    }
}

TEST_CASE("DemingRegression: failures", "[Deming][errors]")
{
    REQUIRE_THROWS_AS(demingRegression({1.0, 2.0}, {1.0, 2.0}), InsufficientDataException);
    REQUIRE_THROWS_AS(demingRegression({1.0, 2.0, 3.0}, {4.0, 4.0, 4.0}), DegenerateRegressionException);

    DemingOptions options;
    options.varianceRatio = 0.0;
    REQUIRE_THROWS_AS(DemingRegression<>(options), InvalidParameterException);

    options = DemingOptions();
    options.bootstrapReplications = 1;
    REQUIRE_THROWS_AS(DemingRegression<>(options), InvalidParameterException);
}
