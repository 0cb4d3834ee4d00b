// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_MOUNTAIN_ANALYZER_H
#define __METHCOMP_MOUNTAIN_ANALYZER_H 1

#include <cstddef>
#include <utility>
#include <vector>
#include "AnalysisConfiguration.h"
#include "MeasurementSeries.h"

namespace methcomp
{
  struct MountainOptions
  {
    std::size_t percentileSteps = AnalysisConfiguration::kDefaultPercentileSteps;
    double centralRangePercent = AnalysisConfiguration::kDefaultCentralRangePercent;
  };

  class MountainResult
  {
  public:
    MountainResult(std::vector<double> probabilities,
                   std::vector<double> quantiles,
                   std::vector<double> foldedCdf,
                   double areaUnderCurve,
                   double median,
                   std::size_t medianIndex,
                   double centralRangeLower,
                   double centralRangeUpper,
                   std::pair<std::size_t, std::size_t> centralRangeIndices,
                   double centralRangePercent)
      : mProbabilities(std::move(probabilities)),
        mQuantiles(std::move(quantiles)),
        mFoldedCdf(std::move(foldedCdf)),
        mAreaUnderCurve(areaUnderCurve),
        mMedian(median),
        mMedianIndex(medianIndex),
        mCentralRangeLower(centralRangeLower),
        mCentralRangeUpper(centralRangeUpper),
        mCentralRangeIndices(centralRangeIndices),
        mCentralRangePercent(centralRangePercent)
    {}

    // q_k = k / (P - 1)
    const std::vector<double>& getProbabilities() const
    {
      return mProbabilities;
    }

    // Difference value at each q_k.
    const std::vector<double>& getQuantiles() const
    {
      return mQuantiles;
    }

    // Folded CDF in percent, peaks at 50.
    const std::vector<double>& getFoldedCdf() const
    {
      return mFoldedCdf;
    }

    // Equals the mean absolute deviation from the median for a fine grid.
    double getAreaUnderCurve() const
    {
      return mAreaUnderCurve;
    }

    double getMedian() const
    {
      return mMedian;
    }

    std::size_t getMedianIndex() const
    {
      return mMedianIndex;
    }

    double getCentralRangeLower() const
    {
      return mCentralRangeLower;
    }

    double getCentralRangeUpper() const
    {
      return mCentralRangeUpper;
    }

    const std::pair<std::size_t, std::size_t>& getCentralRangeIndices() const
    {
      return mCentralRangeIndices;
    }

    double getCentralRangePercent() const
    {
      return mCentralRangePercent;
    }

  private:
    std::vector<double> mProbabilities;
    std::vector<double> mQuantiles;
    std::vector<double> mFoldedCdf;
    double mAreaUnderCurve;
    double mMedian;
    std::size_t mMedianIndex;
    double mCentralRangeLower;
    double mCentralRangeUpper;
    std::pair<std::size_t, std::size_t> mCentralRangeIndices;
    double mCentralRangePercent;
  };

  /**
   * @brief Mountain plot (folded empirical CDF) of the differences x - y.
   *
   * The CDF of the differences is sampled at P equally spaced probabilities
   * and folded at the median, so bias shows as a shifted peak and imprecision
   * as a wide base.
   *
   * @see Krouwer, J.S. and Monti, K.L. (1995). "A simple, graphical method to
   *      evaluate laboratory assays." Eur. J. Clin. Chem. Clin. Biochem. 33: 525-528.
   */
  class MountainAnalyzer
  {
  public:
    // @throws InvalidParameterException for zero steps or a central range
    //         outside [0, 100].
    explicit MountainAnalyzer(const MountainOptions& options = MountainOptions());

    MountainResult analyze(const MeasurementSeries& series) const;

    const MountainOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    std::size_t nearestStep(double probability) const;

  private:
    MountainOptions mOptions;
  };
}

#endif
