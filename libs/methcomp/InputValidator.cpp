// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <cmath>
#include <string>
#include "InputValidator.h"
#include "MethodComparisonException.h"

namespace methcomp
{
  namespace
  {
    void checkFinite(const std::vector<double>& values, const char* methodName)
    {
      for (std::size_t i = 0; i < values.size(); ++i)
        {
          if (!std::isfinite(values[i]))
            throw InvalidValueException("InputValidator::validatePairedSequences - " +
                                        std::string(methodName) + " value at index " +
                                        std::to_string(i) + " is not a finite number", i);
        }
    }
  }

  void InputValidator::validatePairedSequences(const std::vector<double>& method1,
                                               const std::vector<double>& method2,
                                               std::size_t minimumPairs)
  {
    if (method1.size() != method2.size())
      throw ShapeMismatchException("InputValidator::validatePairedSequences - method 1 has " +
                                   std::to_string(method1.size()) + " values but method 2 has " +
                                   std::to_string(method2.size()));

    checkFinite(method1, "method 1");
    checkFinite(method2, "method 2");

    if (method1.size() < minimumPairs)
      throw InsufficientDataException("InputValidator::validatePairedSequences - " +
                                      std::to_string(method1.size()) + " pairs supplied, at least " +
                                      std::to_string(minimumPairs) + " required");
  }

  void InputValidator::validateConfidenceLevel(double confidenceLevel)
  {
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
      throw InvalidParameterException("InputValidator::validateConfidenceLevel - confidence level " +
                                      std::to_string(confidenceLevel) + " must be in (0, 1)");
  }

  void InputValidator::validatePositive(double value, const std::string& parameterName)
  {
    if (!std::isfinite(value) || value <= 0.0)
      throw InvalidParameterException("InputValidator::validatePositive - " + parameterName +
                                      " must be a finite positive number, got " +
                                      std::to_string(value));
  }

  void InputValidator::validatePercentage(double value, const std::string& parameterName)
  {
    if (!(value >= 0.0 && value <= 100.0))
      throw InvalidParameterException("InputValidator::validatePercentage - " + parameterName +
                                      " must be in [0, 100], got " + std::to_string(value));
  }

  void InputValidator::validateBootstrapReplications(std::size_t replications)
  {
    if (replications == 1)
      throw InvalidParameterException("InputValidator::validateBootstrapReplications - "
                                      "a single bootstrap replicate cannot estimate a spread");
  }
}
