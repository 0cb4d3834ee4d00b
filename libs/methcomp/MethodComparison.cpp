// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#include "MethodComparison.h"

namespace methcomp
{
  BlandAltmanResult blandAltman(const std::vector<double>& method1,
                                const std::vector<double>& method2,
                                const BlandAltmanOptions& options)
  {
    BlandAltmanAnalyzer analyzer(options);
    return analyzer.analyze(MeasurementSeries(method1, method2));
  }

  PassingBablokResult passingBablok(const std::vector<double>& method1,
                                    const std::vector<double>& method2,
                                    const PassingBablokOptions& options)
  {
    PassingBablokEstimator<> estimator(options);
    return estimator.estimate(MeasurementSeries(method1, method2));
  }

  LinearRegressionResult linearRegression(const std::vector<double>& method1,
                                          const std::vector<double>& method2,
                                          const LinearRegressionOptions& options)
  {
    LinearRegression regression(options);
    return regression.fit(MeasurementSeries(method1, method2, AnalysisConfiguration::kMinimumRegressionPairs));
  }

  DemingRegressionResult demingRegression(const std::vector<double>& method1,
                                          const std::vector<double>& method2,
                                          const DemingOptions& options)
  {
    DemingRegression<> regression(options);
    return regression.fit(MeasurementSeries(method1, method2, AnalysisConfiguration::kMinimumRegressionPairs));
  }

  MountainResult mountain(const std::vector<double>& method1,
                          const std::vector<double>& method2,
                          const MountainOptions& options)
  {
    MountainAnalyzer analyzer(options);
    return analyzer.analyze(MeasurementSeries(method1, method2));
  }

  ClarkeErrorGridResult clarkeErrorGrid(const std::vector<double>& reference,
                                        const std::vector<double>& test,
                                        const ClarkeErrorGridOptions& options)
  {
    ClarkeErrorGrid grid(options);
    return grid.classify(MeasurementSeries(reference, test, 1));
  }

  ParkesErrorGridResult parkesErrorGrid(const std::vector<double>& reference,
                                        const std::vector<double>& test,
                                        const ParkesErrorGridOptions& options)
  {
    ParkesErrorGrid grid(options);
    return grid.classify(MeasurementSeries(reference, test, 1));
  }
}
