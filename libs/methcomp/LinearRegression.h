// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_LINEAR_REGRESSION_H
#define __METHCOMP_LINEAR_REGRESSION_H 1

#include <cstddef>
#include "AnalysisConfiguration.h"
#include "ConfidenceInterval.h"
#include "MeasurementSeries.h"

namespace methcomp
{
  struct LinearRegressionOptions
  {
    double confidenceLevel = AnalysisConfiguration::kDefaultConfidenceLevel;
  };

  class LinearRegressionResult
  {
  public:
    LinearRegressionResult(double slope,
                           double intercept,
                           double slopeStandardError,
                           double interceptStandardError,
                           const ConfidenceInterval& slopeInterval,
                           const ConfidenceInterval& interceptInterval,
                           double residualStandardError,
                           std::size_t sampleSize,
                           double confidenceLevel)
      : mSlope(slope),
        mIntercept(intercept),
        mSlopeStandardError(slopeStandardError),
        mInterceptStandardError(interceptStandardError),
        mSlopeInterval(slopeInterval),
        mInterceptInterval(interceptInterval),
        mResidualStandardError(residualStandardError),
        mSampleSize(sampleSize),
        mConfidenceLevel(confidenceLevel)
    {}

    double getSlope() const
    {
      return mSlope;
    }

    double getIntercept() const
    {
      return mIntercept;
    }

    double getSlopeStandardError() const
    {
      return mSlopeStandardError;
    }

    double getInterceptStandardError() const
    {
      return mInterceptStandardError;
    }

    const ConfidenceInterval& getSlopeConfidenceInterval() const
    {
      return mSlopeInterval;
    }

    const ConfidenceInterval& getInterceptConfidenceInterval() const
    {
      return mInterceptInterval;
    }

    // sqrt(SSR / (n - 2))
    double getResidualStandardError() const
    {
      return mResidualStandardError;
    }

    std::size_t getSampleSize() const
    {
      return mSampleSize;
    }

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

  private:
    double mSlope;
    double mIntercept;
    double mSlopeStandardError;
    double mInterceptStandardError;
    ConfidenceInterval mSlopeInterval;
    ConfidenceInterval mInterceptInterval;
    double mResidualStandardError;
    std::size_t mSampleSize;
    double mConfidenceLevel;
  };

  /**
   * @brief Ordinary least squares fit of method 2 (y) on method 1 (x).
   *
   * Assumes method 1 is measured without error. Standard errors use
   * s^2 = SSR / (n - 2) and the intervals use t_{1-alpha/2, n-2}.
   */
  class LinearRegression
  {
  public:
    explicit LinearRegression(const LinearRegressionOptions& options = LinearRegressionOptions());

    // @throws InsufficientDataException for fewer than three pairs,
    //         DegenerateRegressionException when every x is identical.
    LinearRegressionResult fit(const MeasurementSeries& series) const;

    const LinearRegressionOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    LinearRegressionOptions mOptions;
  };
}

#endif
