#pragma once

#include "load_test_models.hpp"
#include <string>
#include <vector>

namespace loadplus {

struct ReportThresholds {
  double failErrorRatePercent = 15.0;
  double failMemoryGrowthMB = 100.0;
  double warnErrorRatePercent = 5.0;
  double warnLatencyMs = 1000.0;
  double warnMemoryGrowthMB = 50.0;
};

struct Assessment {
  TestStatus status = TestStatus::PASS;
  std::vector<std::string> recommendations;
};

/**
 * Classifies a summary as PASS / WARNING / FAIL and attaches one
 * recommendation per breached threshold. Advisory only.
 */
class ReportGenerator {
public:
  explicit ReportGenerator(ReportThresholds thresholds = {});

  Assessment assess(const PerformanceSummary &summary) const;

  const ReportThresholds &thresholds() const { return thresholds_; }

  static const std::string &engineFailureRecommendation();

private:
  ReportThresholds thresholds_;
};

} // namespace loadplus
