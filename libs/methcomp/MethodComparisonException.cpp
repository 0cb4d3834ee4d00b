// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include "MethodComparisonException.h"

namespace methcomp
{
  std::string errorKindToString(ErrorKind kind)
  {
    switch (kind)
      {
      case ErrorKind::ShapeMismatch:
        return "ShapeMismatch";
      case ErrorKind::InvalidValue:
        return "InvalidValue";
      case ErrorKind::InsufficientData:
        return "InsufficientData";
      case ErrorKind::DivisionByZero:
        return "DivisionByZero";
      case ErrorKind::DegenerateRegression:
        return "DegenerateRegression";
      case ErrorKind::InvalidParameter:
        return "InvalidParameter";
      }

    return "Unknown";
  }
}
