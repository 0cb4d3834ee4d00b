// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_MEASUREMENT_SERIES_H
#define __METHCOMP_MEASUREMENT_SERIES_H 1

#include <cstddef>
#include <vector>
#include "AnalysisConfiguration.h"

namespace methcomp
{
  // One subject measured by method 1 (x) and method 2 (y).
  class MeasurementPair
  {
  public:
    MeasurementPair(double x, double y)
      : mX(x),
        mY(y)
    {}

    double getX() const
    {
      return mX;
    }

    double getY() const
    {
      return mY;
    }

  private:
    double mX;
    double mY;
  };

  /**
   * @brief Validated, index-aligned paired measurements from one comparison run.
   *
   * Element i of method 1 is paired with element i of method 2; that order is
   * the only pairing information and is preserved exactly. The constructor
   * runs InputValidator::validatePairedSequences, so an existing series is
   * always equal-length, finite, and holds at least minimumPairs pairs.
   */
  class MeasurementSeries
  {
  public:
    MeasurementSeries(std::vector<double> method1,
                      std::vector<double> method2,
                      std::size_t minimumPairs = AnalysisConfiguration::kMinimumPairs);

    std::size_t size() const
    {
      return mX.size();
    }

    const std::vector<double>& getX() const
    {
      return mX;
    }

    const std::vector<double>& getY() const
    {
      return mY;
    }

    MeasurementPair getPair(std::size_t index) const;

    // Same pairs with the two methods exchanged.
    MeasurementSeries swapped() const;

  private:
    std::vector<double> mX;
    std::vector<double> mY;
  };
}

#endif
