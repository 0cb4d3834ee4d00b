// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <cmath>
#include <string>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "SampleStatistics.h"
#include "MethodComparisonException.h"

namespace methcomp
{
  using namespace boost::accumulators;

  namespace
  {
    void requireAtLeast(const std::vector<double>& values, std::size_t count, const char* caller)
    {
      if (values.size() < count)
        throw InsufficientDataException(std::string("SampleStatistics::") + caller + " - " +
                                        std::to_string(values.size()) + " values supplied, at least " +
                                        std::to_string(count) + " required");
    }
  }

  double SampleStatistics::mean(const std::vector<double>& values)
  {
    requireAtLeast(values, 1, "mean");

    accumulator_set<double, features<tag::mean>> stats;
    stats = std::for_each(values.begin(), values.end(), stats);
    return boost::accumulators::mean(stats);
  }

  double SampleStatistics::sampleVariance(const std::vector<double>& values)
  {
    requireAtLeast(values, 2, "sampleVariance");

    // boost::accumulators::variance uses the population (n) denominator
    accumulator_set<double, features<tag::variance>> stats;
    stats = std::for_each(values.begin(), values.end(), stats);

    const double n = static_cast<double>(values.size());
    return boost::accumulators::variance(stats) * n / (n - 1.0);
  }

  double SampleStatistics::sampleStandardDeviation(const std::vector<double>& values)
  {
    return std::sqrt(sampleVariance(values));
  }

  double SampleStatistics::median(const std::vector<double>& values)
  {
    requireAtLeast(values, 1, "median");

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    const std::size_t n = sorted.size();
    if (n % 2 == 1)
      return sorted[n / 2];

    return 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
  }

  double SampleStatistics::quantileOfSorted(const std::vector<double>& sortedValues, double p)
  {
    requireAtLeast(sortedValues, 1, "quantileOfSorted");

    if (!(p >= 0.0 && p <= 1.0))
      throw InvalidParameterException("SampleStatistics::quantileOfSorted - probability " +
                                      std::to_string(p) + " must be in [0, 1]");

    const std::size_t n = sortedValues.size();
    if (n == 1)
      return sortedValues.front();

    const double h = static_cast<double>(n - 1) * p;
    const std::size_t lo = std::min(static_cast<std::size_t>(std::floor(h)), n - 1);
    if (lo == n - 1)
      return sortedValues[lo];

    const double fraction = h - static_cast<double>(lo);
    return sortedValues[lo] + fraction * (sortedValues[lo + 1] - sortedValues[lo]);
  }

  std::vector<double> SampleStatistics::quantiles(const std::vector<double>& values,
                                                  const std::vector<double>& probabilities)
  {
    requireAtLeast(values, 1, "quantiles");

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> result;
    result.reserve(probabilities.size());
    for (double p : probabilities)
      result.push_back(quantileOfSorted(sorted, p));

    return result;
  }
}
