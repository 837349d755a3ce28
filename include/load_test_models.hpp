#pragma once

#include "workload_profile.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace loadplus {

enum class TestStatus { PASS, WARNING, FAIL };

std::string testStatusToString(TestStatus status);

// Higher is worse: PASS < WARNING < FAIL
TestStatus worstStatus(TestStatus a, TestStatus b);

// One completed simulated operation
struct ExecutionSample {
  bool success = false;
  double latencyMs = 0.0;
  std::optional<std::string> error;
};

struct ResourceSnapshot {
  std::int64_t timestampMs = 0; // milliseconds since epoch
  double heapUsedMB = 0.0;
  double cpuPercent = 0.0;
};

struct MemoryUsage {
  double initialMB = 0.0;
  double peakMB = 0.0;
  double finalMB = 0.0;

  double growthMB() const { return finalMB - initialMB; }
};

// Reduction of one run's samples and snapshots
struct PerformanceSummary {
  std::uint64_t totalRequests = 0;
  std::uint64_t successfulRequests = 0;
  std::uint64_t failedRequests = 0;
  double averageLatencyMs = 0.0;
  double minLatencyMs = 0.0;
  double maxLatencyMs = 0.0;
  double throughputReqPerSec = 0.0;
  double errorRatePercent = 0.0;
  MemoryUsage memory;
  std::vector<double> cpuUtilization;
  double durationMs = 0.0; // observed wall-clock span of the run
  std::vector<std::string> errors; // distinct failure messages, sorted

  nlohmann::json toJson() const;
};

struct LoadTestReport {
  std::string runId;
  WorkloadProfile config;
  std::chrono::system_clock::time_point startTime;
  std::chrono::system_clock::time_point endTime;
  PerformanceSummary summary;
  TestStatus status = TestStatus::PASS;
  std::vector<std::string> recommendations;
  bool cancelled = false;
  std::optional<std::string> engineError;

  nlohmann::json toJson() const;

  // Multi-line human readable summary
  std::string summarize() const;
};

nlohmann::json reportsToJson(const std::vector<LoadTestReport> &reports);

// Writes reportsToJson() to path. Throws EngineException (FILE_ERROR).
void writeReportsFile(const std::string &path,
                      const std::vector<LoadTestReport> &reports);

} // namespace loadplus
