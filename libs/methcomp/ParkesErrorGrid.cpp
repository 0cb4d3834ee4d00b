// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/within.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include "ParkesErrorGrid.h"
#include "AnalysisConfiguration.h"
#include "MethodComparisonException.h"

namespace methcomp
{
  namespace
  {
    namespace bg = boost::geometry;

    using GridPoint = bg::model::d2::point_xy<double>;
    using GridPolygon = bg::model::polygon<GridPoint>;

    struct GridVertex
    {
      double x;
      double y;
    };

    /**
     * One side of a zone in mg/dL. The first vertex lies on an axis (y axis
     * above the identity line, x axis below it); the last two vertices give
     * the direction of the ray that runs on to the edge of the plot.
     */
    struct ZoneBoundary
    {
      ParkesZone zone;
      bool aboveIdentity;
      std::vector<GridVertex> vertices;
    };

    const std::vector<ZoneBoundary>& boundariesFor(DiabetesType type)
    {
      static const std::vector<ZoneBoundary> type1{
        {ParkesZone::B, false, {{50, 0}, {50, 30}, {170, 145}, {385, 300}, {550, 450}}},
        {ParkesZone::B, true, {{0, 50}, {30, 50}, {140, 170}, {280, 380}, {430, 550}}},
        {ParkesZone::C, false, {{120, 0}, {120, 30}, {260, 130}, {550, 250}}},
        {ParkesZone::C, true, {{0, 60}, {30, 60}, {50, 80}, {70, 110}, {260, 550}}},
        {ParkesZone::D, false, {{250, 0}, {250, 40}, {550, 150}}},
        {ParkesZone::D, true, {{0, 100}, {25, 100}, {50, 125}, {80, 215}, {125, 550}}},
        {ParkesZone::E, true, {{0, 150}, {35, 155}, {50, 550}}}
      };

      static const std::vector<ZoneBoundary> type2{
        {ParkesZone::B, false, {{50, 0}, {50, 30}, {90, 80}, {330, 230}, {550, 450}}},
        {ParkesZone::B, true, {{0, 50}, {30, 50}, {230, 330}, {440, 550}}},
        {ParkesZone::C, false, {{90, 0}, {260, 130}, {550, 250}}},
        {ParkesZone::C, true, {{0, 60}, {30, 60}, {280, 550}}},
        {ParkesZone::D, false, {{250, 0}, {250, 40}, {410, 110}, {550, 160}}},
        {ParkesZone::D, true, {{0, 80}, {25, 80}, {35, 90}, {125, 550}}},
        {ParkesZone::E, true, {{0, 200}, {35, 200}, {50, 550}}}
      };

      return type == DiabetesType::Type1 ? type1 : type2;
    }

    // Region between a boundary and the plot edge. The axis side is pushed
    // past zero so that readings on an axis fall inside the region.
    GridPolygon makeRegion(const ZoneBoundary& boundary, double scale, double maxX, double maxY)
    {
      const double outside = -1.0;
      const auto& v = boundary.vertices;
      const std::size_t last = v.size() - 1;

      const double slope = (v[last].y - v[last - 1].y) / (v[last].x - v[last - 1].x);
      const double fromX = v[last - 1].x / scale;
      const double fromY = v[last - 1].y / scale;

      GridPolygon region;
      auto& ring = region.outer();

      if (boundary.aboveIdentity)
        ring.push_back(GridPoint(outside, v.front().y / scale));
      else
        ring.push_back(GridPoint(v.front().x / scale, outside));

      for (std::size_t k = 0; k < last; ++k)
        ring.push_back(GridPoint(v[k].x / scale, v[k].y / scale));

      if (boundary.aboveIdentity)
        {
          ring.push_back(GridPoint(fromX + (maxY - fromY) / slope, maxY));
          ring.push_back(GridPoint(outside, maxY));
        }
      else
        {
          ring.push_back(GridPoint(maxX, fromY + (maxX - fromX) * slope));
          ring.push_back(GridPoint(maxX, outside));
        }

      bg::correct(region);
      return region;
    }

    class ParkesRegions
    {
    public:
      ParkesRegions(const ParkesErrorGridOptions& options, double maxReference, double maxTest)
      {
        const double scale = glucoseThresholdScale(options.unit);
        const double extent = AnalysisConfiguration::kParkesGridExtent / scale;
        const double padding = AnalysisConfiguration::kParkesGridPadding / scale;

        const double maxX = std::max(maxReference + padding, extent);
        const double maxY = std::max({maxTest + padding, maxX, extent});

        for (const auto& boundary : boundariesFor(options.diabetesType))
          mRegions.emplace_back(boundary.zone, makeRegion(boundary, scale, maxX, maxY));
      }

      ParkesZone locate(double reference, double test) const
      {
        const GridPoint point(reference, test);

        ParkesZone zone = ParkesZone::A;
        for (const auto& region : mRegions)
          {
            if (region.first > zone && bg::within(point, region.second))
              zone = region.first;
          }

        return zone;
      }

    private:
      std::vector<std::pair<ParkesZone, GridPolygon>> mRegions;
    };
  }

  std::string diabetesTypeToString(DiabetesType type)
  {
    switch (type)
      {
      case DiabetesType::Type1:
        return "type 1";
      case DiabetesType::Type2:
        return "type 2";
      }

    return "unknown";
  }

  std::string parkesZoneToString(ParkesZone zone)
  {
    switch (zone)
      {
      case ParkesZone::A:
        return "A";
      case ParkesZone::B:
        return "B";
      case ParkesZone::C:
        return "C";
      case ParkesZone::D:
        return "D";
      case ParkesZone::E:
        return "E";
      }

    return "unknown";
  }

  ParkesErrorGridResult::ParkesErrorGridResult(std::vector<ParkesZone> zones,
                                               DiabetesType diabetesType,
                                               GlucoseUnit unit)
    : mZones(std::move(zones)),
      mCounts{},
      mDiabetesType(diabetesType),
      mUnit(unit)
  {
    for (auto zone : mZones)
      ++mCounts[static_cast<std::size_t>(zone)];
  }

  double ParkesErrorGridResult::getPercentage(ParkesZone zone) const
  {
    if (mZones.empty())
      return 0.0;

    return AnalysisConfiguration::kPercentScale * static_cast<double>(getCount(zone)) /
      static_cast<double>(mZones.size());
  }

  ParkesZone ParkesErrorGrid::classifyPair(double reference, double test) const
  {
    const ParkesRegions regions(mOptions, reference, test);
    return regions.locate(reference, test);
  }

  ParkesErrorGridResult ParkesErrorGrid::classify(const MeasurementSeries& series) const
  {
    const auto& reference = series.getX();
    const auto& test = series.getY();

    double maxReference = 0.0;
    double maxTest = 0.0;
    for (std::size_t i = 0; i < series.size(); ++i)
      {
        if (reference[i] < 0.0 || test[i] < 0.0)
          throw InvalidValueException("ParkesErrorGrid::classify - glucose reading at index " +
                                      std::to_string(i) + " is negative", i);

        maxReference = std::max(maxReference, reference[i]);
        maxTest = std::max(maxTest, test[i]);
      }

    const ParkesRegions regions(mOptions, maxReference, maxTest);

    std::vector<ParkesZone> zones;
    zones.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
      zones.push_back(regions.locate(reference[i], test[i]));

    return ParkesErrorGridResult(std::move(zones), mOptions.diabetesType, mOptions.unit);
  }
}
