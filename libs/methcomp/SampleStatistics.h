// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_SAMPLE_STATISTICS_H
#define __METHCOMP_SAMPLE_STATISTICS_H 1

#include <vector>

namespace methcomp
{
  /**
   * @struct SampleStatistics
   * @brief Descriptive statistics over a sample of doubles.
   *
   * Every function throws InsufficientDataException when the sample is too
   * small for the statistic (empty, or a single value for the variance).
   */
  struct SampleStatistics
  {
    static double mean(const std::vector<double>& values);

    // Unbiased (n - 1 denominator) variance.
    static double sampleVariance(const std::vector<double>& values);

    static double sampleStandardDeviation(const std::vector<double>& values);

    // Average of the two central order statistics for even sizes.
    static double median(const std::vector<double>& values);

    /**
     * @brief Quantile by linear interpolation between order statistics.
     *
     * For n sorted values v[0..n-1] and probability p in [0, 1], the
     * position h = (n - 1) p is split into floor and fraction and the result
     * is v[floor] + fraction * (v[floor + 1] - v[floor]) (Hyndman-Fan type 7).
     *
     * @param sortedValues Ascending values.
     */
    static double quantileOfSorted(const std::vector<double>& sortedValues, double p);

    // Sorts a copy once and evaluates every probability in order.
    static std::vector<double> quantiles(const std::vector<double>& values,
                                         const std::vector<double>& probabilities);
  };
}

#endif
