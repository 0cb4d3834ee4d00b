// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_DEMING_REGRESSION_H
#define __METHCOMP_DEMING_REGRESSION_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <vector>
#include "AnalysisConfiguration.h"
#include "ConfidenceInterval.h"
#include "InputValidator.h"
#include "MeasurementSeries.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "RngUtils.h"

namespace methcomp
{
  struct DemingOptions
  {
    double varianceRatio = AnalysisConfiguration::kDefaultVarianceRatio;   ///< lambda = var(y error) / var(x error)
    std::size_t bootstrapReplications = AnalysisConfiguration::kDefaultBootstrapReplications; ///< 0 disables intervals
    uint64_t seed = AnalysisConfiguration::kDefaultBootstrapSeed;
    double confidenceLevel = AnalysisConfiguration::kDefaultConfidenceLevel;
    std::ostream* diagnosticLog = nullptr;
  };

  struct DemingEstimate
  {
    double slope;
    double intercept;
    double sigmaX;
    double sigmaY;
  };

  namespace detail
  {
    // Closed-form Deming fit. Returns std::nullopt when Sxy == 0 or the fit
    // is not finite.
    std::optional<DemingEstimate> computeDemingEstimate(const std::vector<double>& x,
							const std::vector<double>& y,
							double varianceRatio);
  }

  /**
   * @brief Bootstrap distribution of the Deming slope and intercept.
   *
   * Slots are indexed by replicate; a slot whose resample was degenerate is
   * marked unusable.
   */
  struct DemingBootstrapSamples
  {
    explicit DemingBootstrapSamples(std::size_t replications)
      : slopes(replications, 0.0),
	intercepts(replications, 0.0),
	usable(replications, 0)
    {}

    std::vector<double> slopes;
    std::vector<double> intercepts;
    std::vector<char> usable;
  };

  class DemingRegressionResult
  {
  public:
    DemingRegressionResult(const DemingEstimate& estimate,
			   std::optional<ConfidenceInterval> slopeInterval,
			   std::optional<ConfidenceInterval> interceptInterval,
			   std::optional<double> slopeStandardError,
			   std::optional<double> interceptStandardError,
			   std::size_t usableReplications,
			   std::size_t skippedReplications,
			   std::size_t sampleSize,
			   double varianceRatio,
			   double confidenceLevel);

    double getSlope() const
    {
      return mEstimate.slope;
    }

    double getIntercept() const
    {
      return mEstimate.intercept;
    }

    // Residual error SD along x.
    double getSigmaX() const
    {
      return mEstimate.sigmaX;
    }

    // Residual error SD along y, sqrt(lambda) * getSigmaX().
    double getSigmaY() const
    {
      return mEstimate.sigmaY;
    }

    bool hasConfidenceIntervals() const
    {
      return mSlopeInterval.has_value();
    }

    const std::optional<ConfidenceInterval>& getSlopeConfidenceInterval() const
    {
      return mSlopeInterval;
    }

    const std::optional<ConfidenceInterval>& getInterceptConfidenceInterval() const
    {
      return mInterceptInterval;
    }

    const std::optional<double>& getSlopeStandardError() const
    {
      return mSlopeStandardError;
    }

    const std::optional<double>& getInterceptStandardError() const
    {
      return mInterceptStandardError;
    }

    std::size_t getUsableReplications() const
    {
      return mUsableReplications;
    }

    std::size_t getSkippedReplications() const
    {
      return mSkippedReplications;
    }

    std::size_t getSampleSize() const
    {
      return mSampleSize;
    }

    double getVarianceRatio() const
    {
      return mVarianceRatio;
    }

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

  private:
    DemingEstimate mEstimate;
    std::optional<ConfidenceInterval> mSlopeInterval;
    std::optional<ConfidenceInterval> mInterceptInterval;
    std::optional<double> mSlopeStandardError;
    std::optional<double> mInterceptStandardError;
    std::size_t mUsableReplications;
    std::size_t mSkippedReplications;
    std::size_t mSampleSize;
    double mVarianceRatio;
    double mConfidenceLevel;
  };

  // Full-sample fit. @throws InsufficientDataException for n < 3,
  // DegenerateRegressionException when Sxy == 0.
  DemingEstimate estimateDeming(const MeasurementSeries& series, double varianceRatio);

  // Percentile intervals and standard errors from the usable replicates.
  // @throws DegenerateRegressionException when fewer than half are usable.
  DemingRegressionResult summarizeDemingBootstrap(const MeasurementSeries& series,
						  const DemingEstimate& estimate,
						  const DemingBootstrapSamples& samples,
						  const DemingOptions& options);

  /**
   * @brief Deming (errors-in-variables) regression of method 2 on method 1.
   *
   * Point estimates come from the closed-form fit on the full sample. When
   * bootstrapReplications > 0 the pairs are resampled with replacement and
   * the fit repeated; replicate b draws from an engine seeded by
   * (seed, b), so the bootstrap distribution is the same for every Executor.
   *
   *  - beta  = (Syy - l*Sxx + sqrt((Syy - l*Sxx)^2 + 4*l*Sxy^2)) / (2*Sxy)
   *  - alpha = ybar - beta * xbar
   *  - xi_i  = (l*x_i + beta*(y_i - alpha)) / (l + beta^2)
   *  - s^2   = (l*sum(x_i - xi_i)^2 + sum(y_i - alpha - beta*xi_i)^2) / (2*l*(n - 2))
   *
   * @tparam Executor Executor policy for the bootstrap replicates.
   * @tparam Eng      Random engine constructed per replicate.
   *
   * @see Linnet, K. (1993). "Evaluation of regression procedures for method
   *      comparison studies." Clin. Chem. 39: 424-432.
   */
  template <class Executor = concurrency::SingleThreadExecutor,
	    class Eng = std::mt19937_64>
  class DemingRegression
  {
  public:
    // @throws InvalidParameterException for a non-positive variance ratio, a
    //         single bootstrap replicate or a confidence level outside (0, 1).
    explicit DemingRegression(const DemingOptions& options = DemingOptions())
      : mOptions(options),
	mExecutor(std::make_shared<Executor>()),
	mChunkSizeHint(0)
    {
      InputValidator::validatePositive(mOptions.varianceRatio, "variance ratio");
      InputValidator::validateConfidenceLevel(mOptions.confidenceLevel);
      InputValidator::validateBootstrapReplications(mOptions.bootstrapReplications);
    }

    DemingRegressionResult fit(const MeasurementSeries& series) const
    {
      const DemingEstimate estimate = estimateDeming(series, mOptions.varianceRatio);
      return summarizeDemingBootstrap(series, estimate, bootstrap(series), mOptions);
    }

    DemingBootstrapSamples bootstrap(const MeasurementSeries& series) const
    {
      const std::size_t replications = mOptions.bootstrapReplications;
      DemingBootstrapSamples samples(replications);
      if (replications == 0)
	return samples;

      const auto& x = series.getX();
      const auto& y = series.getY();
      const std::size_t n = series.size();
      const rng_utils::ReplicateEngineProvider<Eng> provider(mOptions.seed);
      const double varianceRatio = mOptions.varianceRatio;

      concurrency::parallel_for_chunked(static_cast<uint32_t>(replications),
					*mExecutor,
					[&](uint32_t b) {
					  auto engine = provider.make_engine(b);
					  std::vector<double> xs(n);
					  std::vector<double> ys(n);
					  for (std::size_t i = 0; i < n; ++i)
					    {
					      const std::size_t k = rng_utils::get_random_index(engine, n);
					      xs[i] = x[k];
					      ys[i] = y[k];
					    }

					  const auto fit = detail::computeDemingEstimate(xs, ys, varianceRatio);
					  if (fit)
					    {
					      samples.slopes[b] = fit->slope;
					      samples.intercepts[b] = fit->intercept;
					      samples.usable[b] = 1;
					    }
					},
					mChunkSizeHint);

      return samples;
    }

    void setChunkSizeHint(uint32_t replicatesPerTask)
    {
      mChunkSizeHint = replicatesPerTask;
    }

    const DemingOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    DemingOptions mOptions;
    std::shared_ptr<Executor> mExecutor;
    uint32_t mChunkSizeHint;
  };
}

#endif
