// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <string>
#include <boost/math/distributions/students_t.hpp>
#include "ConfidenceIntervalCalculator.h"
#include "InputValidator.h"
#include "MethodComparisonException.h"
#include "NormalQuantile.h"

namespace methcomp
{
  double ConfidenceIntervalCalculator::studentTCriticalValue(std::size_t degreesOfFreedom,
                                                             double confidenceLevel)
  {
    InputValidator::validateConfidenceLevel(confidenceLevel);

    if (degreesOfFreedom == 0)
      throw InvalidParameterException("ConfidenceIntervalCalculator::studentTCriticalValue - degrees of freedom must be positive");

    const double alpha = 1.0 - confidenceLevel;
    boost::math::students_t dist(static_cast<double>(degreesOfFreedom));
    return boost::math::quantile(boost::math::complement(dist, alpha / 2.0));
  }

  double ConfidenceIntervalCalculator::normalCriticalValue(double confidenceLevel)
  {
    InputValidator::validateConfidenceLevel(confidenceLevel);
    return detail::compute_normal_critical_value(confidenceLevel);
  }

  double ConfidenceIntervalCalculator::rankToValue(const std::vector<double>& sortedValues,
                                                   long long rank)
  {
    if (sortedValues.empty())
      throw InsufficientDataException("ConfidenceIntervalCalculator::rankToValue - no values to index");

    const long long lastRank = static_cast<long long>(sortedValues.size());
    const long long clamped = std::min(std::max(rank, 1LL), lastRank);
    return sortedValues[static_cast<std::size_t>(clamped - 1)];
  }

  ConfidenceInterval ConfidenceIntervalCalculator::symmetricInterval(double center, double halfWidth)
  {
    return ConfidenceInterval(center - halfWidth, center + halfWidth);
  }
}
