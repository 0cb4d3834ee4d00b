// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <cmath>
#include <string>
#include "MountainAnalyzer.h"
#include "InputValidator.h"
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

namespace methcomp
{
  MountainAnalyzer::MountainAnalyzer(const MountainOptions& options)
    : mOptions(options)
  {
    if (mOptions.percentileSteps == 0)
      throw InvalidParameterException("MountainAnalyzer - number of percentile steps must be positive");

    InputValidator::validatePercentage(mOptions.centralRangePercent, "central range");
  }

  std::size_t MountainAnalyzer::nearestStep(double probability) const
  {
    const std::size_t last = mOptions.percentileSteps - 1;
    const double position = std::round(probability * static_cast<double>(last));
    return std::min(last, static_cast<std::size_t>(std::max(0.0, position)));
  }

  MountainResult MountainAnalyzer::analyze(const MeasurementSeries& series) const
  {
    const auto& x = series.getX();
    const auto& y = series.getY();

    std::vector<double> differences(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
      differences[i] = x[i] - y[i];

    std::sort(differences.begin(), differences.end());

    const std::size_t steps = mOptions.percentileSteps;
    std::vector<double> probabilities(steps, 0.0);
    std::vector<double> quantiles(steps);
    std::vector<double> folded(steps);

    for (std::size_t k = 0; k < steps; ++k)
      {
        if (steps > 1)
          probabilities[k] = static_cast<double>(k) / static_cast<double>(steps - 1);

        const double q = probabilities[k];
        quantiles[k] = SampleStatistics::quantileOfSorted(differences, q);
        folded[k] = q < 0.5 ? AnalysisConfiguration::kPercentScale * q
                            : AnalysisConfiguration::kPercentScale * (1.0 - q);
      }

    double auc = 0.0;
    for (std::size_t k = 1; k < steps; ++k)
      auc += (quantiles[k] - quantiles[k - 1]) * (folded[k] + folded[k - 1]) / 2.0;

    const std::size_t medianIndex = steps / 2;

    const double halfRange = mOptions.centralRangePercent / (2.0 * AnalysisConfiguration::kPercentScale);
    const double lowProbability = std::max(0.0, 0.5 - halfRange);
    const double highProbability = std::min(1.0, 0.5 + halfRange);

    return MountainResult(std::move(probabilities),
                          quantiles,
                          std::move(folded),
                          auc,
                          quantiles[medianIndex],
                          medianIndex,
                          SampleStatistics::quantileOfSorted(differences, lowProbability),
                          SampleStatistics::quantileOfSorted(differences, highProbability),
                          std::make_pair(nearestStep(lowProbability), nearestStep(highProbability)),
                          mOptions.centralRangePercent);
  }
}
