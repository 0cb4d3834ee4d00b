// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <cmath>
#include <string>
#include <utility>
#include "ClarkeErrorGrid.h"
#include "AnalysisConfiguration.h"
#include "MethodComparisonException.h"

namespace methcomp
{
  std::string clarkeZoneToString(ClarkeZone zone)
  {
    switch (zone)
      {
      case ClarkeZone::A:
        return "A";
      case ClarkeZone::B:
        return "B";
      case ClarkeZone::C:
        return "C";
      case ClarkeZone::D:
        return "D";
      case ClarkeZone::E:
        return "E";
      }

    return "unknown";
  }

  ClarkeErrorGridResult::ClarkeErrorGridResult(std::vector<ClarkeZone> zones, GlucoseUnit unit)
    : mZones(std::move(zones)),
      mCounts{},
      mUnit(unit)
  {
    for (auto zone : mZones)
      ++mCounts[static_cast<std::size_t>(zone)];
  }

  double ClarkeErrorGridResult::getPercentage(ClarkeZone zone) const
  {
    if (mZones.empty())
      return 0.0;

    return AnalysisConfiguration::kPercentScale * static_cast<double>(getCount(zone)) /
      static_cast<double>(mZones.size());
  }

  ClarkeZone ClarkeErrorGrid::classifyPair(double reference, double test) const
  {
    const double scale = glucoseThresholdScale(mOptions.unit);
    const double t70 = 70.0 / scale;
    const double t130 = 130.0 / scale;
    const double t180 = 180.0 / scale;
    const double t240 = 240.0 / scale;
    const double t110 = 110.0 / scale;

    ClarkeZone zone = ClarkeZone::B;

    if ((reference <= t70 && test >= t180) || (reference >= t180 && test <= t70))
      zone = ClarkeZone::E;

    const bool testInDRange = test >= t70 && test < t180;
    if (testInDRange && (reference < t70 || reference > t240))
      zone = ClarkeZone::D;

    if ((reference >= t130 && reference <= t180 && test < 7.0 / 5.0 * (reference - t130)) ||
        (reference > t70 && test > t180 && test > reference + t110))
      zone = ClarkeZone::C;

    // A zero reference has no relative error; only the hypoglycemic rule applies.
    const bool withinTwentyPercent = reference > 0.0 &&
      std::fabs(test - reference) / reference * AnalysisConfiguration::kPercentScale <= 20.0;
    if (withinTwentyPercent || (reference < t70 && test < t70))
      zone = ClarkeZone::A;

    return zone;
  }

  ClarkeErrorGridResult ClarkeErrorGrid::classify(const MeasurementSeries& series) const
  {
    const auto& reference = series.getX();
    const auto& test = series.getY();

    std::vector<ClarkeZone> zones;
    zones.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
      {
        if (reference[i] < 0.0 || test[i] < 0.0)
          throw InvalidValueException("ClarkeErrorGrid::classify - glucose reading at index " +
                                      std::to_string(i) + " is negative", i);

        zones.push_back(classifyPair(reference[i], test[i]));
      }

    return ClarkeErrorGridResult(std::move(zones), mOptions.unit);
  }
}
