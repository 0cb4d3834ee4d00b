// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_INPUT_VALIDATOR_H
#define __METHCOMP_INPUT_VALIDATOR_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "AnalysisConfiguration.h"

namespace methcomp
{
  /**
   * @brief Entry checks shared by every analyzer.
   *
   * All checks are pure and throw on the first violated precondition, so an
   * analysis either starts from fully valid data or does not start at all.
   */
  class InputValidator
  {
  public:
    /**
     * @brief Validate two index-aligned measurement sequences.
     *
     * Checks, in this order:
     *  1. equal length                      -> ShapeMismatchException
     *  2. every element finite (x then y)   -> InvalidValueException (with index)
     *  3. at least minimumPairs pairs       -> InsufficientDataException
     *
     * Length is compared before any element is inspected.
     */
    static void validatePairedSequences(const std::vector<double>& method1,
                                        const std::vector<double>& method2,
                                        std::size_t minimumPairs = AnalysisConfiguration::kMinimumPairs);

    // confidenceLevel must lie in the open interval (0, 1).
    static void validateConfidenceLevel(double confidenceLevel);

    // value must be finite and strictly positive.
    static void validatePositive(double value, const std::string& parameterName);

    // A percentage in the closed interval [0, 100].
    static void validatePercentage(double value, const std::string& parameterName);

    // Zero (no resampling) or at least two replicates.
    static void validateBootstrapReplications(std::size_t replications);
  };
}

#endif
