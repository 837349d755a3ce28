#pragma once

#include "load_test_engine.hpp"
#include "load_test_models.hpp"
#include "workload_profile.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace loadplus {

struct SuiteEntry {
  std::string name;
  WorkloadProfile profile;
};

struct SuiteStatistics {
  size_t totalTests = 0;
  std::map<std::string, size_t> byType; // canonical type name -> count
  double estimatedDurationSeconds = 0.0;
};

struct SuiteResult {
  std::string suiteName;
  std::vector<LoadTestReport> reports;
  TestStatus overallStatus = TestStatus::PASS;
  bool stoppedEarly = false;

  nlohmann::json toJson() const;
};

/**
 * Named, ordered sequence of profiles run one after another through an
 * engine. stop() cancels the profile in progress and skips the rest.
 * The stop is permanent: a suite stopped before run() runs nothing.
 */
class LoadTestSuite {
public:
  LoadTestSuite(std::string name, std::vector<SuiteEntry> entries);

  LoadTestSuite(const LoadTestSuite &) = delete;
  LoadTestSuite &operator=(const LoadTestSuite &) = delete;

  static LoadTestSuite quick();
  static LoadTestSuite comprehensive();
  // "quick" or "comprehensive", throws ConfigurationException otherwise
  static LoadTestSuite byName(const std::string &name);

  const std::string &name() const { return name_; }
  const std::vector<SuiteEntry> &entries() const { return entries_; }

  LoadTestSuite filterByType(WorkloadType type) const;
  SuiteStatistics getStatistics() const;

  SuiteResult run(LoadTestEngine &engine);

  // Safe to call from any thread, e.g. a signal handler thread
  void stop();
  bool isStopped() const { return stopped_.load(); }

private:
  std::string name_;
  std::vector<SuiteEntry> entries_;

  std::atomic<bool> stopped_{false};
  std::mutex runMutex_;
  LoadTestEngine *activeEngine_ = nullptr;
  std::string activeRunId_;
};

} // namespace loadplus
