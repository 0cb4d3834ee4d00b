// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_PASSING_BABLOK_ESTIMATOR_H
#define __METHCOMP_PASSING_BABLOK_ESTIMATOR_H 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "AnalysisConfiguration.h"
#include "ConfidenceInterval.h"
#include "InputValidator.h"
#include "MeasurementSeries.h"
#include "MethodComparisonException.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace methcomp
{
  struct PassingBablokOptions
  {
    double confidenceLevel = AnalysisConfiguration::kDefaultConfidenceLevel;
    std::ostream* diagnosticLog = nullptr;
  };

  /**
   * @brief Slopes that survive the pair exclusion rules, plus what was excluded.
   *
   * A tally covers a block of rows i of the index-pair space {(i, j) : i < j}.
   * Tallies of consecutive row blocks merged in row order hold exactly the
   * slopes of a single-block tally, in the same order.
   */
  struct PairwiseSlopeTally
  {
    std::vector<double> slopes;
    std::size_t duplicatePairs = 0;   ///< x_i == x_j and y_i == y_j
    std::size_t verticalPairs = 0;    ///< x_i == x_j, y_i != y_j
    std::size_t minusOnePairs = 0;    ///< S_ij == -1 exactly

    void merge(const PairwiseSlopeTally& other);
  };

  namespace detail
  {
    // Classify every pair (row, j) with j > row and append to tally.
    void tallyPairwiseSlopes(const std::vector<double>& x,
                             const std::vector<double>& y,
                             std::size_t row,
                             PairwiseSlopeTally& tally);

    // Ascending; -0.0 orders before +0.0 so the order is total.
    void sortSlopes(std::vector<double>& slopes);
  }

  /**
   * @brief Immutable outcome of a Passing-Bablok regression y = intercept + slope * x.
   */
  class PassingBablokResult
  {
  public:
    PassingBablokResult(double slope,
                        double intercept,
                        const ConfidenceInterval& slopeInterval,
                        const ConfidenceInterval& interceptInterval,
                        std::vector<double> sortedSlopes,
                        std::size_t offset,
                        std::size_t duplicatePairs,
                        std::size_t verticalPairs,
                        std::size_t minusOnePairs,
                        std::size_t sampleSize,
                        double medianX,
                        double medianY,
                        double confidenceLevel);

    double getSlope() const
    {
      return mSlope;
    }

    double getIntercept() const
    {
      return mIntercept;
    }

    const ConfidenceInterval& getSlopeConfidenceInterval() const
    {
      return mSlopeInterval;
    }

    const ConfidenceInterval& getInterceptConfidenceInterval() const
    {
      return mInterceptInterval;
    }

    // The ranked slope set K the estimates were read from.
    const std::vector<double>& getSortedSlopes() const
    {
      return mSortedSlopes;
    }

    // Number of retained slopes below -1 (rank shift K).
    std::size_t getOffset() const
    {
      return mOffset;
    }

    std::size_t getExcludedDuplicatePairs() const
    {
      return mDuplicatePairs;
    }

    std::size_t getExcludedVerticalPairs() const
    {
      return mVerticalPairs;
    }

    std::size_t getExcludedMinusOnePairs() const
    {
      return mMinusOnePairs;
    }

    std::size_t getSampleSize() const
    {
      return mSampleSize;
    }

    double getMedianX() const
    {
      return mMedianX;
    }

    double getMedianY() const
    {
      return mMedianY;
    }

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

  private:
    double mSlope;
    double mIntercept;
    ConfidenceInterval mSlopeInterval;
    ConfidenceInterval mInterceptInterval;
    std::vector<double> mSortedSlopes;
    std::size_t mOffset;
    std::size_t mDuplicatePairs;
    std::size_t mVerticalPairs;
    std::size_t mMinusOnePairs;
    std::size_t mSampleSize;
    double mMedianX;
    double mMedianY;
    double mConfidenceLevel;
  };

  /**
   * @brief Turn a merged slope tally into slope, intercept and their intervals.
   *
   * With K the ascending slope set of size N and k = #{S in K : S < -1}:
   *  - slope: 1-based rank (N+1)/2 + k for odd N, mean of ranks N/2 + k and
   *    N/2 + 1 + k for even N
   *  - w = z_{1-alpha/2} * sqrt(n(n-1)(2n+5)/18), n = number of pairs
   *  - M1 = round((N - w)/2), M2 = N - M1 + 1; slope CI = (K[M1 + k], K[M2 + k])
   *  - intercept = median(y) - slope * median(x), and likewise for each CI bound
   * All ranks are clamped into [1, N].
   *
   * @throws InsufficientDataException for fewer than two pairs.
   * @throws DegenerateRegressionException if every pair was excluded.
   */
  PassingBablokResult estimatePassingBablok(const MeasurementSeries& series,
                                            PairwiseSlopeTally tally,
                                            double confidenceLevel,
                                            std::ostream* diagnosticLog);

  /**
   * @brief Passing-Bablok robust regression between two measurement methods.
   *
   * Builds every pairwise slope S_ij = (y_j - y_i)/(x_j - x_i), i < j, and
   * excludes duplicate points, vertical pairs (identical x) and S_ij == -1.
   * The offset-corrected median of the remaining slopes is the estimate.
   *
   * Slope generation is O(n^2). Rows of the index-pair space are split into
   * blocks and handed to the Executor; block results are merged in row order
   * before sorting, so the result does not depend on the executor.
   *
   * @tparam Executor Executor policy from ParallelExecutors.h.
   *
   * @see Passing, H. and Bablok, W. (1983). "A new biometrical procedure for
   *      testing the equality of measurements from two different analytical
   *      methods." J. Clin. Chem. Clin. Biochem. 21: 709-720.
   */
  template <class Executor = concurrency::SingleThreadExecutor>
  class PassingBablokEstimator
  {
  public:
    // @throws InvalidParameterException for a confidence level outside (0, 1).
    explicit PassingBablokEstimator(const PassingBablokOptions& options = PassingBablokOptions())
      : mOptions(options),
        mExecutor(std::make_shared<Executor>()),
        mChunkSizeHint(0)
    {
      InputValidator::validateConfidenceLevel(mOptions.confidenceLevel);
    }

    PassingBablokResult estimate(const MeasurementSeries& series) const
    {
      return estimatePassingBablok(series,
                                   computeSlopes(series),
                                   mOptions.confidenceLevel,
                                   mOptions.diagnosticLog);
    }

    // Every admissible pairwise slope, unsorted, in row order.
    // @throws InsufficientDataException for fewer than two pairs.
    PairwiseSlopeTally computeSlopes(const MeasurementSeries& series) const
    {
      if (series.size() < AnalysisConfiguration::kMinimumPairs)
        throw InsufficientDataException("PassingBablokEstimator::computeSlopes - at least "
                                        + std::to_string(AnalysisConfiguration::kMinimumPairs)
                                        + " pairs are required, got "
                                        + std::to_string(series.size()));

      const auto& x = series.getX();
      const auto& y = series.getY();
      const uint32_t rows = static_cast<uint32_t>(series.size() - 1);

      const auto blocks = concurrency::makeIndexRanges(rows, mChunkSizeHint);
      std::vector<PairwiseSlopeTally> blockTallies(blocks.size());

      concurrency::parallel_for(static_cast<uint32_t>(blocks.size()),
                                *mExecutor,
                                [&](uint32_t b) {
                                  for (uint32_t row = blocks[b].start; row < blocks[b].end; ++row)
                                    detail::tallyPairwiseSlopes(x, y, row, blockTallies[b]);
                                });

      PairwiseSlopeTally merged;
      merged.slopes.reserve(series.size() * (series.size() - 1) / 2);
      for (const auto& tally : blockTallies)
        merged.merge(tally);

      return merged;
    }

    // Number of rows per submitted block; 0 gives one block per hardware thread.
    void setChunkSizeHint(uint32_t rowsPerBlock)
    {
      mChunkSizeHint = rowsPerBlock;
    }

    const PassingBablokOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    PassingBablokOptions mOptions;
    std::shared_ptr<Executor> mExecutor;
    uint32_t mChunkSizeHint;
  };
}

#endif
