// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include "DemingRegression.h"
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

namespace methcomp
{
  namespace detail
  {
    std::optional<DemingEstimate> computeDemingEstimate(const std::vector<double>& x,
                                                        const std::vector<double>& y,
                                                        double varianceRatio)
    {
      const std::size_t n = x.size();
      const double lambda = varianceRatio;

      double xBar = 0.0;
      double yBar = 0.0;
      for (std::size_t i = 0; i < n; ++i)
        {
          xBar += x[i];
          yBar += y[i];
        }
      xBar /= static_cast<double>(n);
      yBar /= static_cast<double>(n);

      double sxx = 0.0;
      double syy = 0.0;
      double sxy = 0.0;
      for (std::size_t i = 0; i < n; ++i)
        {
          const double dx = x[i] - xBar;
          const double dy = y[i] - yBar;
          sxx += dx * dx;
          syy += dy * dy;
          sxy += dx * dy;
        }

      if (sxy == 0.0)
        return std::nullopt;

      const double spread = syy - lambda * sxx;
      const double slope = (spread + std::sqrt(spread * spread + 4.0 * lambda * sxy * sxy)) / (2.0 * sxy);
      const double intercept = yBar - slope * xBar;

      double sumX = 0.0;
      double sumY = 0.0;
      for (std::size_t i = 0; i < n; ++i)
        {
          const double xi = (lambda * x[i] + slope * (y[i] - intercept)) / (lambda + slope * slope);
          const double ex = x[i] - xi;
          const double ey = y[i] - intercept - slope * xi;
          sumX += ex * ex;
          sumY += ey * ey;
        }

      const double sigmaSquared = (lambda * sumX + sumY) / (2.0 * lambda * static_cast<double>(n - 2));
      const DemingEstimate estimate{slope, intercept, std::sqrt(sigmaSquared), std::sqrt(lambda * sigmaSquared)};

      if (!std::isfinite(estimate.slope) || !std::isfinite(estimate.intercept))
        return std::nullopt;

      return estimate;
    }
  }

  DemingRegressionResult::DemingRegressionResult(const DemingEstimate& estimate,
                                                 std::optional<ConfidenceInterval> slopeInterval,
                                                 std::optional<ConfidenceInterval> interceptInterval,
                                                 std::optional<double> slopeStandardError,
                                                 std::optional<double> interceptStandardError,
                                                 std::size_t usableReplications,
                                                 std::size_t skippedReplications,
                                                 std::size_t sampleSize,
                                                 double varianceRatio,
                                                 double confidenceLevel)
    : mEstimate(estimate),
      mSlopeInterval(std::move(slopeInterval)),
      mInterceptInterval(std::move(interceptInterval)),
      mSlopeStandardError(slopeStandardError),
      mInterceptStandardError(interceptStandardError),
      mUsableReplications(usableReplications),
      mSkippedReplications(skippedReplications),
      mSampleSize(sampleSize),
      mVarianceRatio(varianceRatio),
      mConfidenceLevel(confidenceLevel)
  {}

  DemingEstimate estimateDeming(const MeasurementSeries& series, double varianceRatio)
  {
    const std::size_t n = series.size();
    if (n < AnalysisConfiguration::kMinimumRegressionPairs)
      throw InsufficientDataException("DemingRegression::fit - " + std::to_string(n) +
                                      " pairs supplied, at least " +
                                      std::to_string(AnalysisConfiguration::kMinimumRegressionPairs) +
                                      " required");

    const auto estimate = detail::computeDemingEstimate(series.getX(), series.getY(), varianceRatio);
    if (!estimate)
      throw DegenerateRegressionException("DemingRegression::fit - x and y have zero covariance");

    return *estimate;
  }

  DemingRegressionResult summarizeDemingBootstrap(const MeasurementSeries& series,
                                                  const DemingEstimate& estimate,
                                                  const DemingBootstrapSamples& samples,
                                                  const DemingOptions& options)
  {
    const std::size_t replications = samples.usable.size();
    if (replications == 0)
      return DemingRegressionResult(estimate, std::nullopt, std::nullopt, std::nullopt, std::nullopt,
                                    0, 0, series.size(), options.varianceRatio, options.confidenceLevel);

    std::vector<double> slopes;
    std::vector<double> intercepts;
    slopes.reserve(replications);
    intercepts.reserve(replications);
    for (std::size_t b = 0; b < replications; ++b)
      {
        if (!samples.usable[b])
          continue;
        slopes.push_back(samples.slopes[b]);
        intercepts.push_back(samples.intercepts[b]);
      }

    const std::size_t usable = slopes.size();
    const std::size_t skipped = replications - usable;

    if (skipped > 0 && options.diagnosticLog)
      (*options.diagnosticLog) << "DemingRegression: skipped " << skipped << " of " << replications
                               << " degenerate bootstrap replicate(s)" << std::endl;

    const double minimumUsable = AnalysisConfiguration::kMinimumUsableReplicateFraction *
      static_cast<double>(replications);
    if (usable < 2 || static_cast<double>(usable) < minimumUsable)
      throw DegenerateRegressionException("DemingRegression::fit - only " + std::to_string(usable) + " of " +
                                          std::to_string(replications) + " bootstrap replicates were usable");

    const double alpha = 1.0 - options.confidenceLevel;
    const std::vector<double> probabilities{alpha / 2.0, 1.0 - alpha / 2.0};
    const auto slopeBounds = SampleStatistics::quantiles(slopes, probabilities);
    const auto interceptBounds = SampleStatistics::quantiles(intercepts, probabilities);

    return DemingRegressionResult(estimate,
                                  ConfidenceInterval(slopeBounds[0], slopeBounds[1]),
                                  ConfidenceInterval(interceptBounds[0], interceptBounds[1]),
                                  SampleStatistics::sampleStandardDeviation(slopes),
                                  SampleStatistics::sampleStandardDeviation(intercepts),
                                  usable,
                                  skipped,
                                  series.size(),
                                  options.varianceRatio,
                                  options.confidenceLevel);
  }
}
