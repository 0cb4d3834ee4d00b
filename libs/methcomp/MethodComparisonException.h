// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_METHOD_COMPARISON_EXCEPTION_H
#define __METHCOMP_METHOD_COMPARISON_EXCEPTION_H 1

#include <cstddef>
#include <stdexcept>
#include <string>

namespace methcomp
{
  enum class ErrorKind
    {
      ShapeMismatch,
      InvalidValue,
      InsufficientData,
      DivisionByZero,
      DegenerateRegression,
      InvalidParameter
    };

  std::string errorKindToString(ErrorKind kind);

  // Base of every failure reported by the analyzers. Callers that only need
  // to know which precondition failed can switch on getKind().
  class MethodComparisonException : public std::runtime_error
  {
  public:
    MethodComparisonException(ErrorKind kind, const std::string& msg)
      : std::runtime_error(msg),
        mKind(kind)
    {}

    virtual ~MethodComparisonException() = default;

    ErrorKind getKind() const noexcept
    {
      return mKind;
    }

  private:
    ErrorKind mKind;
  };

  // Failures tied to one position of the input sequences.
  class IndexedMethodComparisonException : public MethodComparisonException
  {
  public:
    IndexedMethodComparisonException(ErrorKind kind, const std::string& msg, std::size_t index)
      : MethodComparisonException(kind, msg),
        mIndex(index)
    {}

    std::size_t getIndex() const noexcept
    {
      return mIndex;
    }

  private:
    std::size_t mIndex;
  };

  class ShapeMismatchException : public MethodComparisonException
  {
  public:
    explicit ShapeMismatchException(const std::string& msg)
      : MethodComparisonException(ErrorKind::ShapeMismatch, msg)
    {}
  };

  class InvalidValueException : public IndexedMethodComparisonException
  {
  public:
    InvalidValueException(const std::string& msg, std::size_t index)
      : IndexedMethodComparisonException(ErrorKind::InvalidValue, msg, index)
    {}
  };

  class InsufficientDataException : public MethodComparisonException
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : MethodComparisonException(ErrorKind::InsufficientData, msg)
    {}
  };

  class DivisionByZeroException : public IndexedMethodComparisonException
  {
  public:
    DivisionByZeroException(const std::string& msg, std::size_t index)
      : IndexedMethodComparisonException(ErrorKind::DivisionByZero, msg, index)
    {}
  };

  class DegenerateRegressionException : public MethodComparisonException
  {
  public:
    explicit DegenerateRegressionException(const std::string& msg)
      : MethodComparisonException(ErrorKind::DegenerateRegression, msg)
    {}
  };

  class InvalidParameterException : public MethodComparisonException
  {
  public:
    explicit InvalidParameterException(const std::string& msg)
      : MethodComparisonException(ErrorKind::InvalidParameter, msg)
    {}
  };
} // namespace methcomp

#endif
