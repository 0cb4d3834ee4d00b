// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_CONFIDENCE_INTERVAL_CALCULATOR_H
#define __METHCOMP_CONFIDENCE_INTERVAL_CALCULATOR_H 1

#include <cstddef>
#include <vector>
#include "ConfidenceInterval.h"

namespace methcomp
{
  /**
   * @struct ConfidenceIntervalCalculator
   * @brief Stateless interval arithmetic shared by the analyzers.
   *
   * Critical values are two-sided: for a confidence level CL they return the
   * (1 - (1 - CL)/2) quantile of the reference distribution.
   */
  struct ConfidenceIntervalCalculator
  {
    /**
     * @brief Two-sided Student-t critical value t_{1-alpha/2, df}.
     *
     * Used in place of the normal critical value wherever the standard error
     * itself is estimated from a small sample.
     *
     * @throws InvalidParameterException if degreesOfFreedom == 0 or the
     *         confidence level is outside (0, 1).
     */
    static double studentTCriticalValue(std::size_t degreesOfFreedom, double confidenceLevel);

    /**
     * @brief Two-sided standard normal critical value z_{1-alpha/2}.
     *
     * @throws InvalidParameterException if the confidence level is outside (0, 1).
     */
    static double normalCriticalValue(double confidenceLevel);

    /**
     * @brief Value at a 1-based rank of an ascending sequence.
     *
     * Ranks below 1 map to the first element and ranks above size() map to
     * the last one, so rank arithmetic that runs off either end still yields
     * the most extreme available order statistic.
     *
     * @throws InsufficientDataException if sortedValues is empty.
     */
    static double rankToValue(const std::vector<double>& sortedValues, long long rank);

    // [center - halfWidth, center + halfWidth]
    static ConfidenceInterval symmetricInterval(double center, double halfWidth);
  };
}

#endif
