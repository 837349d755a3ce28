#include "load_test_suite.hpp"
#include "load_exceptions.hpp"
#include "logger.hpp"

namespace loadplus {

namespace {

SuiteEntry entry(const std::string& name, int users, double duration, double rampUp,
                 const std::string& type) {
    return SuiteEntry{name, WorkloadProfile::create(users, duration, rampUp, type)};
}

} // namespace

nlohmann::json SuiteResult::toJson() const {
    return {
        {"suite", suiteName},
        {"overallStatus", testStatusToString(overallStatus)},
        {"stoppedEarly", stoppedEarly},
        {"reports", reportsToJson(reports)}
    };
}

LoadTestSuite::LoadTestSuite(std::string name, std::vector<SuiteEntry> entries)
    : name_(std::move(name)), entries_(std::move(entries)) {}

LoadTestSuite LoadTestSuite::quick() {
    return LoadTestSuite("quick", {
        entry("Component rendering", 3, 10, 2, "component"),
        entry("UI interaction", 2, 8, 1, "ui-interaction"),
        entry("Analytics processing", 3, 8, 1, "analytics")
    });
}

LoadTestSuite LoadTestSuite::comprehensive() {
    return LoadTestSuite("comprehensive", {
        entry("Component rendering under load", 10, 30, 5, "component"),
        entry("Data processing throughput", 5, 20, 3, "data-processing"),
        entry("Analytics processing", 12, 35, 5, "analytics"),
        entry("Concurrent analytics", 8, 25, 3, "analytics-concurrent"),
        entry("UI interaction burst", 8, 25, 4, "ui-interaction"),
        entry("API call saturation", 15, 40, 6, "api-call")
    });
}

LoadTestSuite LoadTestSuite::byName(const std::string& name) {
    if (name == "quick") {
        return quick();
    }
    if (name == "comprehensive") {
        return comprehensive();
    }
    throw ConfigurationException(ErrorCode::INVALID_INPUT, "Unknown load test suite: " + name,
                                 "suite", name);
}

LoadTestSuite LoadTestSuite::filterByType(WorkloadType type) const {
    std::vector<SuiteEntry> filtered;
    for (const auto& e : entries_) {
        if (e.profile.workloadType == type) {
            filtered.push_back(e);
        }
    }
    return LoadTestSuite(name_ + "/" + workloadTypeToString(type), std::move(filtered));
}

SuiteStatistics LoadTestSuite::getStatistics() const {
    SuiteStatistics stats;
    stats.totalTests = entries_.size();
    for (const auto& e : entries_) {
        ++stats.byType[workloadTypeToString(e.profile.workloadType)];
        stats.estimatedDurationSeconds += e.profile.nominalDurationSeconds();
    }
    return stats;
}

SuiteResult LoadTestSuite::run(LoadTestEngine& engine) {
    SuiteResult result;
    result.suiteName = name_;

    auto stats = getStatistics();
    SUITE_LOG_INFO("Running suite '{}': {} tests, about {}s", name_, stats.totalTests,
                   stats.estimatedDurationSeconds);

    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& current = entries_[i];
        if (stopped_.load()) {
            break;
        }

        SUITE_LOG_INFO("[{}/{}] {}", i + 1, entries_.size(), current.name);
        auto pending = engine.startLoadTest(current.profile);
        {
            std::lock_guard<std::mutex> lock(runMutex_);
            activeEngine_ = &engine;
            activeRunId_ = pending.runId;
            if (stopped_.load()) {
                engine.stopTest(pending.runId);
            }
        }

        auto report = pending.result.get();

        {
            std::lock_guard<std::mutex> lock(runMutex_);
            activeEngine_ = nullptr;
            activeRunId_.clear();
        }

        result.overallStatus = worstStatus(result.overallStatus, report.status);
        result.reports.push_back(std::move(report));
    }

    result.stoppedEarly = stopped_.load();
    if (result.stoppedEarly) {
        SUITE_LOG_WARN("Suite '{}' stopped after {} of {} tests", name_, result.reports.size(),
                       entries_.size());
    } else {
        SUITE_LOG_INFO("Suite '{}' finished with status {}", name_,
                       testStatusToString(result.overallStatus));
    }
    return result;
}

void LoadTestSuite::stop() {
    std::lock_guard<std::mutex> lock(runMutex_);
    stopped_.store(true);
    if (activeEngine_ != nullptr && !activeRunId_.empty()) {
        activeEngine_->stopTest(activeRunId_);
    }
}

} // namespace loadplus
