#pragma once

#include <cstddef>
#include <cstdint>

namespace methcomp
{
  namespace AnalysisConfiguration
  {
    // Shared
    constexpr double kDefaultConfidenceLevel = 0.95;
    constexpr std::size_t kMinimumPairs = 2;

    // Bland-Altman
    constexpr double kDefaultLimitOfAgreementMultiplier = 1.96; ///< ~95% coverage under normality
    constexpr double kPercentScale = 100.0;
    constexpr double kLimitVarianceFactor = 3.0;                 ///< Var(limit) ~ 3 SD^2 / n

    // Passing-Bablok
    constexpr double kExcludedSlope = -1.0;
    constexpr double kRankVarianceDenominator = 18.0;            ///< n(n-1)(2n+5)/18

    // Linear and Deming regression need two residual degrees of freedom
    constexpr std::size_t kMinimumRegressionPairs = 3;

    // Deming
    constexpr double kDefaultVarianceRatio = 1.0;
    constexpr std::size_t kDefaultBootstrapReplications = 1000;
    constexpr std::uint64_t kDefaultBootstrapSeed = 0x5eed2021ull;
    constexpr double kMinimumUsableReplicateFraction = 0.5;

    // Mountain plot
    constexpr std::size_t kDefaultPercentileSteps = 100;
    constexpr double kDefaultCentralRangePercent = 68.27;        ///< +/- 1 SD under normality

    // Glucose error grids
    constexpr double kMmolPerLToMgPerDl = 18.0;
    constexpr double kParkesGridExtent = 550.0;                  ///< mg/dL, last published vertex
    constexpr double kParkesGridPadding = 20.0;                  ///< mg/dL beyond the largest reading
  } // namespace AnalysisConfiguration
} // namespace methcomp
