#include "sample_collector.hpp"
#include "logger.hpp"

namespace loadplus {

void SampleCollector::recordSample(ExecutionSample sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(std::move(sample));
}

void SampleCollector::recordSnapshot(const ResourceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.push_back(snapshot);
    COLLECTOR_LOG_DEBUG("Snapshot {} recorded: {} MB heap, {}% cpu", snapshots_.size(),
                        snapshot.heapUsedMB, snapshot.cpuPercent);
}

std::vector<ExecutionSample> SampleCollector::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

std::vector<ResourceSnapshot> SampleCollector::snapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
}

size_t SampleCollector::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

size_t SampleCollector::snapshotCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

} // namespace loadplus
