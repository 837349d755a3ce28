#pragma once

#include "cancellation_token.hpp"
#include "config_manager.hpp"
#include "load_test_models.hpp"
#include "random_source.hpp"
#include "report_generator.hpp"
#include "system_metrics.hpp"
#include "workload_profile.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace loadplus {

// A run started in the background
struct PendingRun {
  std::string runId;
  std::future<LoadTestReport> result;
};

/**
 * Entry point for load tests. Validates a profile, drives the virtual
 * users to completion or cancellation, aggregates the samples and keeps a
 * bounded history of the resulting reports.
 *
 * Invalid profiles are rejected with ConfigurationException before anything
 * is scheduled. Any other failure during a run is turned into a FAIL report
 * carrying engineError, which is recorded like any other report.
 */
class LoadTestEngine {
public:
  LoadTestEngine();
  // Throws ConfigurationException when the config does not validate
  explicit LoadTestEngine(EngineConfig config,
                          std::shared_ptr<RandomSource> random = nullptr,
                          std::shared_ptr<ResourceProbe> probe = nullptr);
  ~LoadTestEngine();

  LoadTestEngine(const LoadTestEngine &) = delete;
  LoadTestEngine &operator=(const LoadTestEngine &) = delete;

  LoadTestReport runLoadTest(const WorkloadProfile &profile);
  // Caller-chosen id, so another thread can stopTest() it
  LoadTestReport runLoadTest(const WorkloadProfile &profile,
                             const std::string &runId);
  PendingRun startLoadTest(const WorkloadProfile &profile);

  // No-op for unknown or finished runs
  void stopTest(const std::string &runId);
  void stopAll();

  std::vector<LoadTestReport> getTestResults() const;
  void clearResults();
  std::vector<std::string> getActiveRunIds() const;

  std::string nextRunId();
  const EngineConfig &config() const { return config_; }

private:
  class RunRegistration;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void validateProfile(const WorkloadProfile &profile) const;
  std::shared_ptr<CancellationToken> registerRun(const std::string &runId);
  void unregisterRun(const std::string &runId);

  LoadTestReport executeRun(const WorkloadProfile &profile,
                            const std::string &runId,
                            const std::shared_ptr<CancellationToken> &token);
  void recordReport(const LoadTestReport &report);
  void reapFinishedWorkers();

  EngineConfig config_;
  std::shared_ptr<RandomSource> random_;
  std::shared_ptr<ResourceProbe> probe_;
  ReportGenerator reportGenerator_;

  mutable std::mutex runsMutex_;
  std::unordered_map<std::string, std::shared_ptr<CancellationToken>>
      activeRuns_;

  mutable std::mutex historyMutex_;
  std::deque<LoadTestReport> history_;

  std::mutex workersMutex_;
  std::vector<Worker> workers_;

  std::atomic<std::uint64_t> sequence_{0};
};

} // namespace loadplus
