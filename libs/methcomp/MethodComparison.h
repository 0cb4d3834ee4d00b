// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential

#ifndef __METHCOMP_METHOD_COMPARISON_H
#define __METHCOMP_METHOD_COMPARISON_H 1

#include <vector>
#include "BlandAltmanAnalyzer.h"
#include "ClarkeErrorGrid.h"
#include "DemingRegression.h"
#include "LinearRegression.h"
#include "MethodComparisonException.h"
#include "MountainAnalyzer.h"
#include "ParkesErrorGrid.h"
#include "PassingBablokEstimator.h"

namespace methcomp
{
  /**
   * Single-call entry points. Each validates the paired sequences, runs the
   * analysis on the calling thread and returns an immutable result, or
   * throws a MethodComparisonException. Use the analyzer classes directly
   * to choose an executor policy.
   */

  BlandAltmanResult blandAltman(const std::vector<double>& method1,
                                const std::vector<double>& method2,
                                const BlandAltmanOptions& options = BlandAltmanOptions());

  PassingBablokResult passingBablok(const std::vector<double>& method1,
                                    const std::vector<double>& method2,
                                    const PassingBablokOptions& options = PassingBablokOptions());

  LinearRegressionResult linearRegression(const std::vector<double>& method1,
                                          const std::vector<double>& method2,
                                          const LinearRegressionOptions& options = LinearRegressionOptions());

  DemingRegressionResult demingRegression(const std::vector<double>& method1,
                                          const std::vector<double>& method2,
                                          const DemingOptions& options = DemingOptions());

  MountainResult mountain(const std::vector<double>& method1,
                          const std::vector<double>& method2,
                          const MountainOptions& options = MountainOptions());

  // reference and test glucose readings; a single pair is enough
  ClarkeErrorGridResult clarkeErrorGrid(const std::vector<double>& reference,
                                        const std::vector<double>& test,
                                        const ClarkeErrorGridOptions& options = ClarkeErrorGridOptions());

  ParkesErrorGridResult parkesErrorGrid(const std::vector<double>& reference,
                                        const std::vector<double>& test,
                                        const ParkesErrorGridOptions& options = ParkesErrorGridOptions());
}

#endif
