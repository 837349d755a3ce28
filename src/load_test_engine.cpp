#include "load_test_engine.hpp"
#include "load_exceptions.hpp"
#include "logger.hpp"
#include "result_aggregator.hpp"
#include "sample_collector.hpp"
#include "virtual_user_scheduler.hpp"
#include "workload_simulator.hpp"
#include <algorithm>
#include <boost/asio.hpp>
#include <sstream>

namespace net = boost::asio;

namespace loadplus {

// Removes the run from the active set when the run ends, however it ends
class LoadTestEngine::RunRegistration {
public:
    RunRegistration(LoadTestEngine& engine, std::string runId)
        : engine_(engine), runId_(std::move(runId)) {}
    ~RunRegistration() { engine_.unregisterRun(runId_); }

    RunRegistration(const RunRegistration&) = delete;
    RunRegistration& operator=(const RunRegistration&) = delete;

private:
    LoadTestEngine& engine_;
    std::string runId_;
};

namespace {

std::shared_ptr<RandomSource> makeRandomSource(std::uint32_t seed) {
    if (seed != 0) {
        return std::make_shared<MersenneRandomSource>(seed);
    }
    return std::make_shared<MersenneRandomSource>();
}

} // namespace

LoadTestEngine::LoadTestEngine() : LoadTestEngine(EngineConfig{}) {}

LoadTestEngine::LoadTestEngine(EngineConfig config, std::shared_ptr<RandomSource> random,
                               std::shared_ptr<ResourceProbe> probe)
    : config_(std::move(config)),
      random_(std::move(random)),
      probe_(std::move(probe)),
      reportGenerator_(config_.thresholds) {
    auto validation = config_.validate();
    for (const auto& warning : validation.warnings) {
        ENGINE_LOG_WARN("Engine configuration: {}", warning);
    }
    if (!validation.isValid) {
        std::ostringstream message;
        message << "Invalid engine configuration";
        for (const auto& error : validation.errors) {
            message << "; " << error;
        }
        ENGINE_LOG_ERROR(message.str());
        throw ConfigurationException(ErrorCode::CONFIGURATION_ERROR, message.str(), "engine");
    }

    if (!random_) {
        random_ = makeRandomSource(config_.randomSeed);
    }
    if (!probe_) {
        probe_ = std::make_shared<SystemMetrics>();
    }

    ENGINE_LOG_DEBUG("Load test engine created, history capacity {}", config_.historyCapacity);
}

LoadTestEngine::~LoadTestEngine() {
    stopAll();

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::string LoadTestEngine::nextRunId() {
    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "load-test-" + std::to_string(epochMs) + "-" + std::to_string(++sequence_);
}

void LoadTestEngine::validateProfile(const WorkloadProfile& profile) const {
    try {
        profile.validate();
    } catch (const ConfigurationException& e) {
        ENGINE_LOG_WARN("Rejected load test profile: {}", e.toLogString());
        throw;
    }

    if (!profile.workloadName.empty() && !isKnownWorkloadType(profile.workloadName)) {
        ENGINE_LOG_WARN("Unknown workload type '{}', using the generic simulator",
                        profile.workloadName);
    }
}

std::shared_ptr<CancellationToken> LoadTestEngine::registerRun(const std::string& runId) {
    if (runId.empty()) {
        throw createConfigurationError("runId", runId, "run id must not be empty");
    }

    std::lock_guard<std::mutex> lock(runsMutex_);
    if (activeRuns_.count(runId) != 0) {
        throw ConfigurationException(ErrorCode::RUN_ALREADY_ACTIVE,
                                     "Run " + runId + " is already active", "runId", runId);
    }
    auto token = std::make_shared<CancellationToken>();
    activeRuns_.emplace(runId, token);
    return token;
}

void LoadTestEngine::unregisterRun(const std::string& runId) {
    std::lock_guard<std::mutex> lock(runsMutex_);
    activeRuns_.erase(runId);
}

LoadTestReport LoadTestEngine::runLoadTest(const WorkloadProfile& profile) {
    return runLoadTest(profile, nextRunId());
}

LoadTestReport LoadTestEngine::runLoadTest(const WorkloadProfile& profile,
                                           const std::string& runId) {
    validateProfile(profile);
    auto token = registerRun(runId);
    RunRegistration registration(*this, runId);
    return executeRun(profile, runId, token);
}

PendingRun LoadTestEngine::startLoadTest(const WorkloadProfile& profile) {
    validateProfile(profile);
    reapFinishedWorkers();

    PendingRun pending;
    pending.runId = nextRunId();
    auto token = registerRun(pending.runId);

    std::packaged_task<LoadTestReport()> task(
        [this, profile, runId = pending.runId, token]() {
            RunRegistration registration(*this, runId);
            return executeRun(profile, runId, token);
        });
    pending.result = task.get_future();

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workersMutex_);
    workers_.push_back(Worker{std::thread([task = std::move(task), finished]() mutable {
                                  task();
                                  finished->store(true);
                              }),
                              finished});

    ENGINE_LOG_INFO_RUN("Load test started in background", pending.runId);
    return pending;
}

void LoadTestEngine::reapFinishedWorkers() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->finished->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void LoadTestEngine::stopTest(const std::string& runId) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        auto it = activeRuns_.find(runId);
        if (it == activeRuns_.end()) {
            ENGINE_LOG_DEBUG("stopTest ignored for inactive run {}", runId);
            return;
        }
        token = it->second;
    }
    ENGINE_LOG_INFO_RUN("Stop requested", runId);
    token->cancel();
}

void LoadTestEngine::stopAll() {
    std::vector<std::shared_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        for (const auto& [runId, token] : activeRuns_) {
            tokens.push_back(token);
        }
    }
    for (auto& token : tokens) {
        token->cancel();
    }
}

LoadTestReport LoadTestEngine::executeRun(const WorkloadProfile& profile,
                                          const std::string& runId,
                                          const std::shared_ptr<CancellationToken>& token) {
    LoadTestReport report;
    report.runId = runId;
    report.config = profile;
    report.startTime = std::chrono::system_clock::now();

    ENGINE_LOG_INFO_RUN("Starting load test: {} users, {}s duration, {}s ramp-up, {} workload",
                        runId, profile.concurrency, profile.duration, profile.rampUpSeconds,
                        profile.displayName());

    auto markFailed = [&report, &runId](const LoadTestException& error) {
        ENGINE_LOG_ERROR_RUN("Load test aborted by engine failure: {}", runId, error.toLogString());
        std::string explanation = error.getMessage();
        auto details = error.getContext().find("details");
        if (details != error.getContext().end()) {
            explanation += ": " + details->second;
        }
        report.status = TestStatus::FAIL;
        report.engineError = explanation;
        report.recommendations = {ReportGenerator::engineFailureRecommendation()};
        report.cancelled = false;
    };

    try {
        SampleCollector collector;
        collector.recordSnapshot(probe_->sample());

        double observedMs = 0.0;
        {
            net::io_context ioc;
            auto settings = config_.simulators.resolve(profile.workloadType, profile.overrides);
            auto simulator = createSimulator(ioc, profile.workloadType, settings, *random_);
            VirtualUserScheduler scheduler(ioc, profile, *simulator, collector, *probe_, *random_,
                                           token, config_.schedulerSettings(), runId);
            observedMs = scheduler.run();
        }

        collector.recordSnapshot(probe_->sample());

        report.summary = ResultAggregator::aggregate(collector.samples(), collector.snapshots(),
                                                     observedMs);
        auto assessment = reportGenerator_.assess(report.summary);
        report.status = assessment.status;
        report.recommendations = std::move(assessment.recommendations);
        report.cancelled = token->isCancelled();
    } catch (const LoadTestException& e) {
        markFailed(e);
    } catch (const std::exception& e) {
        markFailed(createEngineError(ErrorCode::INTERNAL_ERROR, "LoadTestEngine", e.what()));
    }

    report.endTime = std::chrono::system_clock::now();
    recordReport(report);

    ENGINE_LOG_INFO_RUN("Load test finished with status {}: {} requests, {}% errors, {} req/s",
                        runId, testStatusToString(report.status), report.summary.totalRequests,
                        report.summary.errorRatePercent, report.summary.throughputReqPerSec);
    EngineLogger::logPerformance("load_test", report.summary.durationMs,
                                 {{"run_id", runId}, {"status", testStatusToString(report.status)}});
    EngineLogger::logMetric("load_test.throughput", report.summary.throughputReqPerSec, "req/s");
    EngineLogger::logMetric("load_test.error_rate", report.summary.errorRatePercent, "%");
    EngineLogger::logMetric("load_test.average_latency", report.summary.averageLatencyMs, "ms");
    return report;
}

void LoadTestEngine::recordReport(const LoadTestReport& report) {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.push_back(report);
    while (history_.size() > static_cast<size_t>(config_.historyCapacity)) {
        history_.pop_front();
    }
}

std::vector<LoadTestReport> LoadTestEngine::getTestResults() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return std::vector<LoadTestReport>(history_.begin(), history_.end());
}

void LoadTestEngine::clearResults() {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.clear();
    ENGINE_LOG_DEBUG("Result history cleared");
}

std::vector<std::string> LoadTestEngine::getActiveRunIds() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        ids.reserve(activeRuns_.size());
        for (const auto& [runId, token] : activeRuns_) {
            ids.push_back(runId);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace loadplus
