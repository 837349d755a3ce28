#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace loadplus {

enum class WorkloadType {
  COMPONENT,
  DATA_PROCESSING,
  UI_INTERACTION,
  API_CALL,
  ANALYTICS,
  ANALYTICS_CONCURRENT,
  RESEARCH_QUESTION,
  CONTEXT_PROCESSING,
  GENERIC
};

std::string workloadTypeToString(WorkloadType type);

// Case-insensitive. Accepts "api" and "analytics-processing" as aliases.
// Unknown names map to GENERIC.
WorkloadType parseWorkloadType(const std::string &name);
bool isKnownWorkloadType(const std::string &name);
const std::vector<WorkloadType> &allWorkloadTypes();

// Per-run replacements for the simulator defaults of the profile's type
struct SimulatorOverrides {
  std::optional<double> minLatencyMs;
  std::optional<double> maxLatencyMs;
  std::optional<double> failureProbability;

  bool empty() const {
    return !minLatencyMs && !maxLatencyMs && !failureProbability;
  }
};

struct WorkloadProfile {
  int concurrency = 1;
  double duration = 0.0;      // seconds
  double rampUpSeconds = 0.0; // seconds
  WorkloadType workloadType = WorkloadType::GENERIC;
  std::string workloadName; // identifier as requested, may be an alias
  SimulatorOverrides overrides;

  static WorkloadProfile create(int concurrency, double duration,
                                double rampUpSeconds,
                                const std::string &workloadName);

  // Throws ConfigurationException
  void validate() const;

  std::string displayName() const;
  double nominalDurationSeconds() const { return duration + rampUpSeconds; }

  nlohmann::json toJson() const;
};

} // namespace loadplus
