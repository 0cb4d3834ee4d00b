// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_PARKES_ERROR_GRID_H
#define __METHCOMP_PARKES_ERROR_GRID_H 1

#include <array>
#include <cstddef>
#include <string>
#include <vector>
#include "GlucoseUnit.h"
#include "MeasurementSeries.h"

namespace methcomp
{
  enum class DiabetesType
    {
      Type1,
      Type2
    };

  std::string diabetesTypeToString(DiabetesType type);

  /// Parkes consensus error grid zones, from no effect on outcome (A) to dangerous (E).
  enum class ParkesZone
    {
      A = 0,
      B,
      C,
      D,
      E
    };

  constexpr std::size_t kNumParkesZones = 5;

  std::string parkesZoneToString(ParkesZone zone);

  struct ParkesErrorGridOptions
  {
    DiabetesType diabetesType = DiabetesType::Type1;
    GlucoseUnit unit = GlucoseUnit::MgPerDl;
  };

  class ParkesErrorGridResult
  {
  public:
    ParkesErrorGridResult(std::vector<ParkesZone> zones, DiabetesType diabetesType, GlucoseUnit unit);

    // Zone of each (reference, test) pair, in input order.
    const std::vector<ParkesZone>& getZones() const
    {
      return mZones;
    }

    std::size_t getCount(ParkesZone zone) const
    {
      return mCounts[static_cast<std::size_t>(zone)];
    }

    double getPercentage(ParkesZone zone) const;

    std::size_t getSampleSize() const
    {
      return mZones.size();
    }

    DiabetesType getDiabetesType() const
    {
      return mDiabetesType;
    }

    GlucoseUnit getUnit() const
    {
      return mUnit;
    }

  private:
    std::vector<ParkesZone> mZones;
    std::array<std::size_t, kNumParkesZones> mCounts;
    DiabetesType mDiabetesType;
    GlucoseUnit mUnit;
  };

  /**
   * @brief Parkes (consensus) error grid classification of glucose readings.
   *
   * Method 1 (x) is the reference reading and method 2 (y) the test reading.
   * Zones B to E are each the union of a region above the identity line and
   * one below it (type 1 has no lower E region). The regions are bounded by
   * the published piecewise-linear boundaries; the last segment of each
   * boundary is extended to the edge of the plot. The highest zone whose
   * region holds the reading in its interior wins; everything else is A, so
   * a reading exactly on a boundary takes the lower zone.
   *
   * Vertices are in mg/dL and are divided by 18 for mmol/L.
   *
   * @see Parkes, J.L. et al. (2000). "A new consensus error grid to evaluate
   *      the clinical significance of inaccuracies in the measurement of blood
   *      glucose." Diabetes Care 23: 1143-1148.
   */
  class ParkesErrorGrid
  {
  public:
    explicit ParkesErrorGrid(const ParkesErrorGridOptions& options = ParkesErrorGridOptions())
      : mOptions(options)
    {}

    // @throws InvalidValueException for a negative reading.
    ParkesErrorGridResult classify(const MeasurementSeries& series) const;

    ParkesZone classifyPair(double reference, double test) const;

    const ParkesErrorGridOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    ParkesErrorGridOptions mOptions;
  };
}

#endif
