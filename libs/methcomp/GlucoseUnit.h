// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_GLUCOSE_UNIT_H
#define __METHCOMP_GLUCOSE_UNIT_H 1

#include <string>
#include "AnalysisConfiguration.h"

namespace methcomp
{
  enum class GlucoseUnit
    {
      MgPerDl,
      MmolPerL
    };

  inline std::string glucoseUnitToString(GlucoseUnit unit)
  {
    switch (unit)
      {
      case GlucoseUnit::MgPerDl:
        return "mg/dL";
      case GlucoseUnit::MmolPerL:
        return "mmol/L";
      }

    return "unknown";
  }

  // Divisor that turns an mg/dL threshold into one in the given unit.
  inline double glucoseThresholdScale(GlucoseUnit unit)
  {
    return unit == GlucoseUnit::MmolPerL ? AnalysisConfiguration::kMmolPerLToMgPerDl : 1.0;
  }
}

#endif
