// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include "BlandAltmanAnalyzer.h"
#include "ConfidenceIntervalCalculator.h"
#include "InputValidator.h"
#include "MethodComparisonException.h"
#include "SampleStatistics.h"

namespace methcomp
{
  namespace
  {
    void requireFinite(double value, std::size_t index, const char* quantity)
    {
      if (!std::isfinite(value))
        throw InvalidValueException("BlandAltmanAnalyzer::analyze - " + std::string(quantity) + " of pair " +
                                    std::to_string(index) + " overflows the range of double", index);
    }
  }

  std::string differenceModeToString(DifferenceMode mode)
  {
    switch (mode)
      {
      case DifferenceMode::Absolute:
        return "absolute";
      case DifferenceMode::Relative:
        return "relative";
      }

    return "unknown";
  }

  BlandAltmanResult::BlandAltmanResult(std::vector<double> means,
                                       std::vector<double> differences,
                                       double bias,
                                       double standardDeviation,
                                       double lowerLimitOfAgreement,
                                       double upperLimitOfAgreement,
                                       DifferenceMode mode,
                                       double limitOfAgreementMultiplier,
                                       double confidenceLevel,
                                       std::optional<ConfidenceInterval> biasInterval,
                                       std::optional<ConfidenceInterval> lowerLimitInterval,
                                       std::optional<ConfidenceInterval> upperLimitInterval)
    : mMeans(std::move(means)),
      mDifferences(std::move(differences)),
      mBias(bias),
      mStandardDeviation(standardDeviation),
      mLowerLimitOfAgreement(lowerLimitOfAgreement),
      mUpperLimitOfAgreement(upperLimitOfAgreement),
      mMode(mode),
      mLimitOfAgreementMultiplier(limitOfAgreementMultiplier),
      mConfidenceLevel(confidenceLevel),
      mBiasInterval(std::move(biasInterval)),
      mLowerLimitInterval(std::move(lowerLimitInterval)),
      mUpperLimitInterval(std::move(upperLimitInterval))
  {}

  BlandAltmanAnalyzer::BlandAltmanAnalyzer(const BlandAltmanOptions& options)
    : mOptions(options)
  {
    InputValidator::validatePositive(mOptions.limitOfAgreementMultiplier, "limit of agreement multiplier");
    InputValidator::validateConfidenceLevel(mOptions.confidenceLevel);
  }

  std::vector<double> BlandAltmanAnalyzer::computeDifferences(const MeasurementSeries& series,
                                                              const std::vector<double>& means) const
  {
    const auto& x = series.getX();
    const auto& y = series.getY();

    std::vector<double> differences(series.size());
    for (std::size_t i = 0; i < series.size(); ++i)
      {
        const double delta = y[i] - x[i];
        requireFinite(delta, i, "difference");

        if (mOptions.mode == DifferenceMode::Absolute)
          {
            differences[i] = delta;
            continue;
          }

        if (means[i] == 0.0)
          throw DivisionByZeroException("BlandAltmanAnalyzer::analyze - relative difference undefined, mean of pair " +
                                        std::to_string(i) + " is zero", i);

        differences[i] = delta / means[i] * AnalysisConfiguration::kPercentScale;
        requireFinite(differences[i], i, "relative difference");
      }

    return differences;
  }

  BlandAltmanResult BlandAltmanAnalyzer::analyze(const MeasurementSeries& series) const
  {
    const auto& x = series.getX();
    const auto& y = series.getY();
    const std::size_t n = series.size();

    std::vector<double> means(n);
    for (std::size_t i = 0; i < n; ++i)
      {
        means[i] = (x[i] + y[i]) / 2.0;
        requireFinite(means[i], i, "mean");
      }

    std::vector<double> differences = computeDifferences(series, means);

    const double bias = SampleStatistics::mean(differences);
    const double sd = SampleStatistics::sampleStandardDeviation(differences);

    // Finite differences can still overflow once summed or squared; blame the largest one.
    if (!std::isfinite(bias) || !std::isfinite(sd))
      {
        const auto largest = std::max_element(differences.begin(), differences.end(), [](double a, double b) {
          return std::fabs(a) < std::fabs(b);
        });
        const auto index = static_cast<std::size_t>(largest - differences.begin());
        throw InvalidValueException("BlandAltmanAnalyzer::analyze - bias or spread overflows the range of double, "
                                    "largest difference at pair " + std::to_string(index), index);
      }

    const double halfSpread = mOptions.limitOfAgreementMultiplier * sd;
    const double lowerLimit = bias - halfSpread;
    const double upperLimit = bias + halfSpread;

    std::optional<ConfidenceInterval> biasInterval;
    std::optional<ConfidenceInterval> lowerInterval;
    std::optional<ConfidenceInterval> upperInterval;

    if (mOptions.computeConfidenceIntervals)
      {
        const double t = ConfidenceIntervalCalculator::studentTCriticalValue(n - 1, mOptions.confidenceLevel);
        const double sampleSize = static_cast<double>(n);
        const double seBias = sd / std::sqrt(sampleSize);
        const double seLimit = sd * std::sqrt(AnalysisConfiguration::kLimitVarianceFactor / sampleSize);

        biasInterval = ConfidenceIntervalCalculator::symmetricInterval(bias, t * seBias);
        lowerInterval = ConfidenceIntervalCalculator::symmetricInterval(lowerLimit, t * seLimit);
        upperInterval = ConfidenceIntervalCalculator::symmetricInterval(upperLimit, t * seLimit);
      }

    return BlandAltmanResult(std::move(means),
                             std::move(differences),
                             bias,
                             sd,
                             lowerLimit,
                             upperLimit,
                             mOptions.mode,
                             mOptions.limitOfAgreementMultiplier,
                             mOptions.confidenceLevel,
                             biasInterval,
                             lowerInterval,
                             upperInterval);
  }
}
