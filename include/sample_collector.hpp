#pragma once

#include "load_test_models.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace loadplus {

// Append-only buffers for one run's samples and resource snapshots
class SampleCollector {
public:
  SampleCollector() = default;
  SampleCollector(const SampleCollector &) = delete;
  SampleCollector &operator=(const SampleCollector &) = delete;

  void recordSample(ExecutionSample sample);
  void recordSnapshot(const ResourceSnapshot &snapshot);

  // Copies, safe to call while users are still recording
  std::vector<ExecutionSample> samples() const;
  std::vector<ResourceSnapshot> snapshots() const;

  size_t sampleCount() const;
  size_t snapshotCount() const;

private:
  mutable std::mutex mutex_;
  std::vector<ExecutionSample> samples_;
  std::vector<ResourceSnapshot> snapshots_;
};

} // namespace loadplus
