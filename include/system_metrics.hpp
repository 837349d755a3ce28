#pragma once

#include "load_test_models.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>

namespace loadplus {

// Supplies the resource snapshots taken during a run
class ResourceProbe {
public:
  virtual ~ResourceProbe() = default;
  virtual ResourceSnapshot sample() = 0;
};

/**
 * Process resource probe. Reads resident memory and CPU usage of the
 * current process from the OS.
 */
class SystemMetrics : public ResourceProbe {
public:
  ResourceSnapshot sample() override;

  size_t getProcessMemoryUsage() const; // bytes
  double getProcessCpuUsage();          // percent since the previous call

private:
  // Previous CPU reading, for the delta computation
  std::mutex cpuMutex_;
  double lastCpuSeconds_{0.0};
  std::chrono::steady_clock::time_point lastCpuTime_;
  bool hasCpuReading_{false};

  double readProcessCpuSeconds() const;
};

} // namespace loadplus
