// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <stdexcept>
#include <string>
#include <utility>
#include "MeasurementSeries.h"
#include "InputValidator.h"

namespace methcomp
{
  MeasurementSeries::MeasurementSeries(std::vector<double> method1,
                                       std::vector<double> method2,
                                       std::size_t minimumPairs)
    : mX(std::move(method1)),
      mY(std::move(method2))
  {
    InputValidator::validatePairedSequences(mX, mY, minimumPairs);
  }

  MeasurementPair MeasurementSeries::getPair(std::size_t index) const
  {
    if (index >= mX.size())
      throw std::out_of_range("MeasurementSeries::getPair - index " + std::to_string(index) +
                              " out of range for series of size " + std::to_string(mX.size()));

    return MeasurementPair(mX[index], mY[index]);
  }

  MeasurementSeries MeasurementSeries::swapped() const
  {
    return MeasurementSeries(mY, mX, 1);
  }
}
