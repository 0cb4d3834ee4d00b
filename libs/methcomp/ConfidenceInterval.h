// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_CONFIDENCE_INTERVAL_H
#define __METHCOMP_CONFIDENCE_INTERVAL_H 1

#include <algorithm>
#include <ostream>

namespace methcomp
{
  // Closed interval [lower, upper]; the constructor orders its arguments.
  class ConfidenceInterval
  {
  public:
    ConfidenceInterval(double bound1, double bound2)
      : mLower(std::min(bound1, bound2)),
        mUpper(std::max(bound1, bound2))
    {}

    double getLower() const
    {
      return mLower;
    }

    double getUpper() const
    {
      return mUpper;
    }

    double width() const
    {
      return mUpper - mLower;
    }

    bool contains(double value) const
    {
      return value >= mLower && value <= mUpper;
    }

    bool operator==(const ConfidenceInterval& rhs) const
    {
      return mLower == rhs.mLower && mUpper == rhs.mUpper;
    }

    bool operator!=(const ConfidenceInterval& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    double mLower;
    double mUpper;
  };

  inline std::ostream& operator<<(std::ostream& os, const ConfidenceInterval& ci)
  {
    return os << "[" << ci.getLower() << ", " << ci.getUpper() << "]";
  }
}

#endif
