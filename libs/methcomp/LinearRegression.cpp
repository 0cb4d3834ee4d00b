// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <cmath>
#include <string>
#include "LinearRegression.h"
#include "ConfidenceIntervalCalculator.h"
#include "InputValidator.h"
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

namespace methcomp
{
  LinearRegression::LinearRegression(const LinearRegressionOptions& options)
    : mOptions(options)
  {
    InputValidator::validateConfidenceLevel(mOptions.confidenceLevel);
  }

  LinearRegressionResult LinearRegression::fit(const MeasurementSeries& series) const
  {
    const std::size_t n = series.size();
    if (n < AnalysisConfiguration::kMinimumRegressionPairs)
      throw InsufficientDataException("LinearRegression::fit - " + std::to_string(n) +
                                      " pairs supplied, at least " +
                                      std::to_string(AnalysisConfiguration::kMinimumRegressionPairs) +
                                      " required");

    const auto& x = series.getX();
    const auto& y = series.getY();
    const double xBar = SampleStatistics::mean(x);
    const double yBar = SampleStatistics::mean(y);

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      {
        const double dx = x[i] - xBar;
        sxx += dx * dx;
        sxy += dx * (y[i] - yBar);
      }

    if (sxx == 0.0)
      throw DegenerateRegressionException("LinearRegression::fit - all x values are identical");

    const double slope = sxy / sxx;
    const double intercept = yBar - slope * xBar;

    double ssr = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      {
        const double residual = y[i] - (intercept + slope * x[i]);
        ssr += residual * residual;
      }

    const double sampleSize = static_cast<double>(n);
    const double s2 = ssr / (sampleSize - 2.0);
    const double seSlope = std::sqrt(s2 / sxx);
    const double seIntercept = std::sqrt(s2 * (1.0 / sampleSize + xBar * xBar / sxx));
    const double t = ConfidenceIntervalCalculator::studentTCriticalValue(n - 2, mOptions.confidenceLevel);

    return LinearRegressionResult(slope,
                                  intercept,
                                  seSlope,
                                  seIntercept,
                                  ConfidenceIntervalCalculator::symmetricInterval(slope, t * seSlope),
                                  ConfidenceIntervalCalculator::symmetricInterval(intercept, t * seIntercept),
                                  std::sqrt(s2),
                                  n,
                                  mOptions.confidenceLevel);
  }
}
