// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_BLAND_ALTMAN_ANALYZER_H
#define __METHCOMP_BLAND_ALTMAN_ANALYZER_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "AnalysisConfiguration.h"
#include "ConfidenceInterval.h"
#include "MeasurementSeries.h"

namespace methcomp
{
  enum class DifferenceMode
    {
      Absolute,   ///< d = y - x
      Relative    ///< d = (y - x) / ((x + y) / 2) * 100
    };

  std::string differenceModeToString(DifferenceMode mode);

  struct BlandAltmanOptions
  {
    DifferenceMode mode = DifferenceMode::Absolute;
    double limitOfAgreementMultiplier = AnalysisConfiguration::kDefaultLimitOfAgreementMultiplier;
    double confidenceLevel = AnalysisConfiguration::kDefaultConfidenceLevel;
    bool computeConfidenceIntervals = true;
  };

  /**
   * @brief Immutable outcome of a Bland-Altman analysis.
   *
   * The per-pair means and differences keep the input order. The three
   * confidence intervals are either all present or all absent, depending on
   * BlandAltmanOptions::computeConfidenceIntervals.
   */
  class BlandAltmanResult
  {
  public:
    BlandAltmanResult(std::vector<double> means,
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
                      std::optional<ConfidenceInterval> upperLimitInterval);

    const std::vector<double>& getMeans() const
    {
      return mMeans;
    }

    const std::vector<double>& getDifferences() const
    {
      return mDifferences;
    }

    std::size_t getSampleSize() const
    {
      return mDifferences.size();
    }

    double getBias() const
    {
      return mBias;
    }

    double getStandardDeviation() const
    {
      return mStandardDeviation;
    }

    double getLowerLimitOfAgreement() const
    {
      return mLowerLimitOfAgreement;
    }

    double getUpperLimitOfAgreement() const
    {
      return mUpperLimitOfAgreement;
    }

    DifferenceMode getDifferenceMode() const
    {
      return mMode;
    }

    double getLimitOfAgreementMultiplier() const
    {
      return mLimitOfAgreementMultiplier;
    }

    double getConfidenceLevel() const
    {
      return mConfidenceLevel;
    }

    bool hasConfidenceIntervals() const
    {
      return mBiasInterval.has_value();
    }

    const std::optional<ConfidenceInterval>& getBiasConfidenceInterval() const
    {
      return mBiasInterval;
    }

    const std::optional<ConfidenceInterval>& getLowerLimitConfidenceInterval() const
    {
      return mLowerLimitInterval;
    }

    const std::optional<ConfidenceInterval>& getUpperLimitConfidenceInterval() const
    {
      return mUpperLimitInterval;
    }

  private:
    std::vector<double> mMeans;
    std::vector<double> mDifferences;
    double mBias;
    double mStandardDeviation;
    double mLowerLimitOfAgreement;
    double mUpperLimitOfAgreement;
    DifferenceMode mMode;
    double mLimitOfAgreementMultiplier;
    double mConfidenceLevel;
    std::optional<ConfidenceInterval> mBiasInterval;
    std::optional<ConfidenceInterval> mLowerLimitInterval;
    std::optional<ConfidenceInterval> mUpperLimitInterval;
  };

  /**
   * @brief Bland-Altman agreement statistics for two measurement methods.
   *
   * Algorithm:
   *  - mean_i = (x_i + y_i) / 2
   *  - d_i = y_i - x_i, or (y_i - x_i) / mean_i * 100 in relative mode
   *  - bias = mean(d), SD = sample standard deviation of d (n - 1)
   *  - limits of agreement = bias -/+ z * SD
   *  - CI(bias)  = bias  -/+ t_{1-alpha/2, n-1} * SD / sqrt(n)
   *  - CI(limit) = limit -/+ t_{1-alpha/2, n-1} * SD * sqrt(3 / n)
   *
   * A zero pair mean in relative mode rejects the whole series with
   * DivisionByZeroException identifying the first offending pair.
   *
   * @see Bland, J.M. and Altman, D.G. (1986). "Statistical methods for assessing
   *      agreement between two methods of clinical measurement." Lancet 327: 307-310.
   */
  class BlandAltmanAnalyzer
  {
  public:
    // @throws InvalidParameterException for a non-positive multiplier or a
    //         confidence level outside (0, 1).
    explicit BlandAltmanAnalyzer(const BlandAltmanOptions& options = BlandAltmanOptions());

    // @throws DivisionByZeroException for a zero pair mean in relative mode.
    // @throws InvalidValueException when a mean, difference, bias or SD
    //         overflows; the index names the offending (or largest) pair.
    BlandAltmanResult analyze(const MeasurementSeries& series) const;

    const BlandAltmanOptions& getOptions() const
    {
      return mOptions;
    }

  private:
    std::vector<double> computeDifferences(const MeasurementSeries& series,
                                           const std::vector<double>& means) const;

  private:
    BlandAltmanOptions mOptions;
  };
}

#endif
