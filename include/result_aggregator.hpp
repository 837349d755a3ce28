#pragma once

#include "load_test_models.hpp"
#include <vector>

namespace loadplus {

/**
 * Reduces one run's samples and snapshots into a PerformanceSummary.
 * Pure and independent of sample order. An empty input yields an
 * all-zero summary.
 */
class ResultAggregator {
public:
  static PerformanceSummary aggregate(const std::vector<ExecutionSample> &samples,
                                      const std::vector<ResourceSnapshot> &snapshots,
                                      double observedDurationMs);
};

} // namespace loadplus
