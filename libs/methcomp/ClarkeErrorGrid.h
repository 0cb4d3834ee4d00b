// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_CLARKE_ERROR_GRID_H
#define __METHCOMP_CLARKE_ERROR_GRID_H 1

#include <array>
#include <cstddef>
#include <string>
#include <vector>
#include "GlucoseUnit.h"
#include "MeasurementSeries.h"

namespace methcomp
{
  /// Clarke error grid zones, from clinically accurate (A) to erroneous treatment (E).
  enum class ClarkeZone
    {
      A = 0,
      B,
      C,
      D,
      E
    };

  constexpr std::size_t kNumClarkeZones = 5;

  std::string clarkeZoneToString(ClarkeZone zone);

  struct ClarkeErrorGridOptions
  {
    GlucoseUnit unit = GlucoseUnit::MgPerDl;
  };

  class ClarkeErrorGridResult
  {
  public:
    ClarkeErrorGridResult(std::vector<ClarkeZone> zones, GlucoseUnit unit);

    // Zone of each (reference, test) pair, in input order.
    const std::vector<ClarkeZone>& getZones() const
    {
      return mZones;
    }

    std::size_t getCount(ClarkeZone zone) const
    {
      return mCounts[static_cast<std::size_t>(zone)];
    }

    double getPercentage(ClarkeZone zone) const;

    std::size_t getSampleSize() const
    {
      return mZones.size();
    }

    GlucoseUnit getUnit() const
    {
      return mUnit;
    }

  private:
    std::vector<ClarkeZone> mZones;
    std::array<std::size_t, kNumClarkeZones> mCounts;
    GlucoseUnit mUnit;
  };

  /**
   * @brief Clarke error grid classification of glucose readings.
   *
   * Method 1 (x) is the reference reading and method 2 (y) the test reading.
   * Every pair starts in zone B and is overwritten by the rules for E, D, C
   * and A in that order, so a later rule wins:
   *  - E: (ref <= 70 and test >= 180) or (ref >= 180 and test <= 70)
   *  - D: 70 <= test < 180 and (ref < 70 or ref > 240)
   *  - C: (130 <= ref <= 180 and test < 7/5 (ref - 130)) or
   *       (ref > 70 and test > 180 and test > ref + 110)
   *  - A: |test - ref| / ref <= 20% or (ref < 70 and test < 70)
   * Thresholds are in mg/dL and are divided by 18 for mmol/L.
   *
   * @see Clarke, W.L. et al. (1987). "Evaluating clinical accuracy of systems
   *      for self-monitoring of blood glucose." Diabetes Care 10: 622-628.
   */
  class ClarkeErrorGrid
  {
  public:
    explicit ClarkeErrorGrid(const ClarkeErrorGridOptions& options = ClarkeErrorGridOptions())
      : mOptions(options)
    {}

    // @throws InvalidValueException for a negative reading.
    ClarkeErrorGridResult classify(const MeasurementSeries& series) const;

    ClarkeZone classifyPair(double reference, double test) const;

    const ClarkeErrorGridOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    ClarkeErrorGridOptions mOptions;
  };
}

#endif
