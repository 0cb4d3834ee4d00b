// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include "PassingBablokEstimator.h"
#include "ConfidenceIntervalCalculator.h"
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

namespace methcomp
{
  void PairwiseSlopeTally::merge(const PairwiseSlopeTally& other)
  {
    slopes.insert(slopes.end(), other.slopes.begin(), other.slopes.end());
    duplicatePairs += other.duplicatePairs;
    verticalPairs += other.verticalPairs;
    minusOnePairs += other.minusOnePairs;
  }

  namespace detail
  {
    void tallyPairwiseSlopes(const std::vector<double>& x,
                             const std::vector<double>& y,
                             std::size_t row,
                             PairwiseSlopeTally& tally)
    {
      const std::size_t n = x.size();
      for (std::size_t j = row + 1; j < n; ++j)
        {
          const double dx = x[j] - x[row];
          const double dy = y[j] - y[row];

          if (dx == 0.0)
            {
              if (dy == 0.0)
                ++tally.duplicatePairs;
              else
                ++tally.verticalPairs;
              continue;
            }

          const double slope = dy / dx;
          if (slope == AnalysisConfiguration::kExcludedSlope)
            {
              ++tally.minusOnePairs;
              continue;
            }

          tally.slopes.push_back(slope);
        }
    }

    void sortSlopes(std::vector<double>& slopes)
    {
      std::stable_sort(slopes.begin(), slopes.end(), [](double a, double b) {
        if (a != b)
          return a < b;
        return std::signbit(a) && !std::signbit(b);
      });
    }
  }

  PassingBablokResult::PassingBablokResult(double slope,
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
                                           double confidenceLevel)
    : mSlope(slope),
      mIntercept(intercept),
      mSlopeInterval(slopeInterval),
      mInterceptInterval(interceptInterval),
      mSortedSlopes(std::move(sortedSlopes)),
      mOffset(offset),
      mDuplicatePairs(duplicatePairs),
      mVerticalPairs(verticalPairs),
      mMinusOnePairs(minusOnePairs),
      mSampleSize(sampleSize),
      mMedianX(medianX),
      mMedianY(medianY),
      mConfidenceLevel(confidenceLevel)
  {}

  PassingBablokResult estimatePassingBablok(const MeasurementSeries& series,
                                            PairwiseSlopeTally tally,
                                            double confidenceLevel,
                                            std::ostream* diagnosticLog)
  {
    if (series.size() < AnalysisConfiguration::kMinimumPairs)
      throw InsufficientDataException("PassingBablokEstimator::estimate - at least "
                                      + std::to_string(AnalysisConfiguration::kMinimumPairs)
                                      + " pairs are required, got "
                                      + std::to_string(series.size()));

    if (tally.verticalPairs > 0 && diagnosticLog)
      (*diagnosticLog) << "PassingBablokEstimator: excluded " << tally.verticalPairs
                       << " vertical pair(s) with identical x and different y" << std::endl;

    auto& slopes = tally.slopes;
    if (slopes.empty())
      throw DegenerateRegressionException("PassingBablokEstimator::estimate - every pairwise slope was excluded ("
                                          + std::to_string(tally.duplicatePairs) + " duplicate, "
                                          + std::to_string(tally.verticalPairs) + " vertical, "
                                          + std::to_string(tally.minusOnePairs) + " equal to -1)");

    detail::sortSlopes(slopes);

    const long long N = static_cast<long long>(slopes.size());
    const long long K = static_cast<long long>(
      std::lower_bound(slopes.begin(), slopes.end(), AnalysisConfiguration::kExcludedSlope) - slopes.begin());

    double slope;
    if (N % 2 == 1)
      slope = ConfidenceIntervalCalculator::rankToValue(slopes, (N + 1) / 2 + K);
    else
      slope = 0.5 * (ConfidenceIntervalCalculator::rankToValue(slopes, N / 2 + K) +
                     ConfidenceIntervalCalculator::rankToValue(slopes, N / 2 + 1 + K));

    const double n = static_cast<double>(series.size());
    const double z = ConfidenceIntervalCalculator::normalCriticalValue(confidenceLevel);
    const double w = z * std::sqrt(n * (n - 1.0) * (2.0 * n + 5.0) /
                                   AnalysisConfiguration::kRankVarianceDenominator);

    const long long m1 = std::llround((static_cast<double>(N) - w) / 2.0);
    const long long m2 = N - m1 + 1;

    const double slopeLower = ConfidenceIntervalCalculator::rankToValue(slopes, m1 + K);
    const double slopeUpper = ConfidenceIntervalCalculator::rankToValue(slopes, m2 + K);

    const double medianX = SampleStatistics::median(series.getX());
    const double medianY = SampleStatistics::median(series.getY());
    const double intercept = medianY - slope * medianX;

    return PassingBablokResult(slope,
                               intercept,
                               ConfidenceInterval(slopeLower, slopeUpper),
                               ConfidenceInterval(medianY - slopeLower * medianX,
                                                  medianY - slopeUpper * medianX),
                               std::move(slopes),
                               static_cast<std::size_t>(K),
                               tally.duplicatePairs,
                               tally.verticalPairs,
                               tally.minusOnePairs,
                               series.size(),
                               medianX,
                               medianY,
                               confidenceLevel);
  }
}
