#include "result_aggregator.hpp"
#include "logger.hpp"
#include <algorithm>
#include <limits>
#include <set>

namespace loadplus {

PerformanceSummary ResultAggregator::aggregate(const std::vector<ExecutionSample>& samples,
                                               const std::vector<ResourceSnapshot>& snapshots,
                                               double observedDurationMs) {
    PerformanceSummary summary;
    summary.durationMs = std::max(0.0, observedDurationMs);
    summary.totalRequests = samples.size();

    std::set<std::string> distinctErrors;
    double latencySum = 0.0;
    double minLatency = std::numeric_limits<double>::max();
    double maxLatency = 0.0;

    for (const auto& sample : samples) {
        if (sample.success) {
            ++summary.successfulRequests;
        } else {
            ++summary.failedRequests;
            if (sample.error) {
                distinctErrors.insert(*sample.error);
            }
        }
        latencySum += sample.latencyMs;
        minLatency = std::min(minLatency, sample.latencyMs);
        maxLatency = std::max(maxLatency, sample.latencyMs);
    }

    if (summary.totalRequests > 0) {
        auto total = static_cast<double>(summary.totalRequests);
        summary.averageLatencyMs = latencySum / total;
        summary.minLatencyMs = minLatency;
        summary.maxLatencyMs = maxLatency;
        summary.errorRatePercent = static_cast<double>(summary.failedRequests) / total * 100.0;
        if (summary.durationMs > 0.0) {
            summary.throughputReqPerSec = total / (summary.durationMs / 1000.0);
        }
    }
    summary.errors.assign(distinctErrors.begin(), distinctErrors.end());

    if (!snapshots.empty()) {
        summary.memory.initialMB = snapshots.front().heapUsedMB;
        summary.memory.finalMB = snapshots.back().heapUsedMB;
        summary.memory.peakMB = std::max_element(snapshots.begin(), snapshots.end(),
                                                 [](const ResourceSnapshot& a,
                                                    const ResourceSnapshot& b) {
                                                     return a.heapUsedMB < b.heapUsedMB;
                                                 })->heapUsedMB;
        summary.cpuUtilization.reserve(snapshots.size());
        for (const auto& snapshot : snapshots) {
            summary.cpuUtilization.push_back(snapshot.cpuPercent);
        }
    }

    AGGREGATOR_LOG_DEBUG("Aggregated {} samples ({} failed) and {} snapshots over {} ms",
                         summary.totalRequests, summary.failedRequests, snapshots.size(),
                         summary.durationMs);
    return summary;
}

} // namespace loadplus
