#pragma once

#include "random_source.hpp"
#include "workload_profile.hpp"
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace net = boost::asio;

namespace loadplus {

struct SimulatorSettings {
  double minLatencyMs = 100.0;
  double maxLatencyMs = 300.0;
  double failureProbability = 0.05;
  std::string errorMessage = "Simulated operation failed";

  SimulatorSettings withOverrides(const SimulatorOverrides &overrides) const;
  bool operator==(const SimulatorSettings &other) const;
};

// Timer delay for a millisecond count. Negative values become zero and
// values past the steady clock's range saturate at its maximum.
std::chrono::microseconds toTimerDelay(double milliseconds);

struct SimulationOutcome {
  bool success = true;
  std::optional<std::string> error;
};

/**
 * Latency ranges and failure probabilities per workload type. Starts from
 * the built-in defaults; individual types can be replaced from config.
 */
class SimulatorCatalog {
public:
  SimulatorCatalog();

  static SimulatorSettings builtInDefaults(WorkloadType type);

  const SimulatorSettings &settingsFor(WorkloadType type) const;
  void setSettings(WorkloadType type, SimulatorSettings settings);

  // Catalog entry for the type with the profile's overrides applied
  SimulatorSettings resolve(WorkloadType type,
                            const SimulatorOverrides &overrides) const;

private:
  std::unordered_map<WorkloadType, SimulatorSettings> settings_;
};

/**
 * One unit of simulated work. simulate() suspends the calling virtual user
 * on the io_context for a sampled latency and then invokes the handler
 * exactly once. Implementations keep no state between invocations.
 */
class WorkloadSimulator {
public:
  using CompletionHandler = std::function<void(const SimulationOutcome &)>;

  WorkloadSimulator(net::io_context &ioc, WorkloadType type,
                    SimulatorSettings settings, RandomSource &random);
  virtual ~WorkloadSimulator() = default;

  WorkloadSimulator(const WorkloadSimulator &) = delete;
  WorkloadSimulator &operator=(const WorkloadSimulator &) = delete;

  virtual void simulate(CompletionHandler handler) = 0;

  WorkloadType type() const { return type_; }
  const SimulatorSettings &settings() const { return settings_; }

protected:
  double sampleLatencyMs();
  SimulationOutcome drawOutcome();
  void completeAfter(std::chrono::microseconds delay, SimulationOutcome outcome,
                     CompletionHandler handler);

  net::io_context &ioc_;
  WorkloadType type_;
  SimulatorSettings settings_;
  RandomSource &random_;
};

// Single timed wait. Used for component, api-call, analytics,
// research-question, context-processing and generic workloads.
class TimedWorkloadSimulator : public WorkloadSimulator {
public:
  using WorkloadSimulator::WorkloadSimulator;
  void simulate(CompletionHandler handler) override;
};

// Generates, filters and sorts a record batch, then waits out the rest of
// the sampled latency.
class BatchProcessingSimulator : public WorkloadSimulator {
public:
  BatchProcessingSimulator(net::io_context &ioc, SimulatorSettings settings,
                           RandomSource &random, size_t batchSize = 1000);
  void simulate(CompletionHandler handler) override;

  // Returns the number of records that survived the filter
  static size_t processBatch(size_t batchSize, std::uint32_t seed);

private:
  size_t batchSize_;
};

// Splits the sampled latency into a sequence of short steps, like a burst
// of clicks on one control.
class InteractionSequenceSimulator : public WorkloadSimulator {
public:
  InteractionSequenceSimulator(net::io_context &ioc, SimulatorSettings settings,
                               RandomSource &random, int steps = 10);
  void simulate(CompletionHandler handler) override;

private:
  int steps_;
};

// Fans out parallel sub-operations and completes when the slowest one does
class ConcurrentAnalyticsSimulator : public WorkloadSimulator {
public:
  ConcurrentAnalyticsSimulator(net::io_context &ioc, SimulatorSettings settings,
                               RandomSource &random, int fanOut = 3);
  void simulate(CompletionHandler handler) override;

private:
  int fanOut_;
};

std::unique_ptr<WorkloadSimulator>
createSimulator(net::io_context &ioc, WorkloadType type,
                const SimulatorSettings &settings, RandomSource &random);

} // namespace loadplus
