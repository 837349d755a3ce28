#include <gtest/gtest.h>
#include "load_test_engine.hpp"
#include "test_doubles.hpp"
#include <chrono>
#include <set>
#include <thread>

namespace loadplus {

class LoadTestEngineTest : public ::testing::Test {
protected:
    void SetUp() override { test::configureQuietLogging(); }

    // Short latencies and jitter so runs finish close to their duration
    static EngineConfig fastConfig(int historyCapacity = 100) {
        EngineConfig config;
        config.historyCapacity = historyCapacity;
        config.jitterMinMs = 5;
        config.jitterMaxMs = 10;
        config.snapshotProbability = 0.5;
        config.randomSeed = 42;
        for (auto type : allWorkloadTypes()) {
            auto settings = config.simulators.settingsFor(type);
            settings.minLatencyMs = 5;
            settings.maxLatencyMs = 15;
            config.simulators.setSettings(type, settings);
        }
        return config;
    }

    // Deterministic engine: never fails, never snapshots mid-run
    static std::unique_ptr<LoadTestEngine> deterministicEngine(int historyCapacity = 100) {
        return std::make_unique<LoadTestEngine>(
            fastConfig(historyCapacity), std::make_shared<test::FixedRandomSource>(),
            std::make_shared<test::ScriptedProbe>(std::vector<double>{100.0, 101.0}));
    }

    static double elapsedMs(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                         start).count();
    }
};

TEST_F(LoadTestEngineTest, SingleUserApiRunProducesReport) {
    LoadTestEngine engine(fastConfig());
    auto profile = WorkloadProfile::create(1, 1, 0, "api");

    auto report = engine.runLoadTest(profile);

    EXPECT_EQ(report.runId.rfind("load-test-", 0), 0u);
    EXPECT_EQ(report.config.workloadType, WorkloadType::API_CALL);
    EXPECT_GE(report.summary.totalRequests, 1u);
    EXPECT_EQ(report.summary.totalRequests,
              report.summary.successfulRequests + report.summary.failedRequests);
    EXPECT_GE(report.summary.errorRatePercent, 0.0);
    EXPECT_LE(report.summary.errorRatePercent, 100.0);
    EXPECT_GE(report.summary.durationMs, 1000.0);
    EXPECT_LE(report.startTime, report.endTime);
    EXPECT_FALSE(report.cancelled);
    EXPECT_FALSE(report.engineError.has_value());
    EXPECT_GE(report.summary.memory.peakMB, report.summary.memory.initialMB);
    EXPECT_GE(report.summary.memory.peakMB, report.summary.memory.finalMB);

    auto history = engine.getTestResults();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].runId, report.runId);
    EXPECT_TRUE(engine.getActiveRunIds().empty());
}

TEST_F(LoadTestEngineTest, HealthyDeterministicRunPasses) {
    auto engine = deterministicEngine();
    auto report = engine->runLoadTest(WorkloadProfile::create(2, 0.3, 0, "component"));

    EXPECT_EQ(report.status, TestStatus::PASS);
    EXPECT_TRUE(report.recommendations.empty());
    EXPECT_EQ(report.summary.failedRequests, 0u);
    EXPECT_DOUBLE_EQ(report.summary.memory.initialMB, 100.0);
    EXPECT_DOUBLE_EQ(report.summary.memory.finalMB, 101.0);
}

TEST_F(LoadTestEngineTest, InvalidProfileIsRejectedBeforeScheduling) {
    auto engine = deterministicEngine();

    EXPECT_THROW(engine->runLoadTest(WorkloadProfile::create(0, 5, 0, "api")),
                 ConfigurationException);
    EXPECT_THROW(engine->runLoadTest(WorkloadProfile::create(1, -1, 0, "api")),
                 ConfigurationException);
    EXPECT_THROW(engine->startLoadTest(WorkloadProfile::create(1, 1, -2, "api")),
                 ConfigurationException);

    EXPECT_TRUE(engine->getTestResults().empty());
    EXPECT_TRUE(engine->getActiveRunIds().empty());
}

TEST_F(LoadTestEngineTest, ConcurrentRampedRunsAreBothRecorded) {
    LoadTestEngine engine(fastConfig());
    auto profile = WorkloadProfile::create(10, 5, 2, "ui-interaction");

    auto first = engine.startLoadTest(profile);
    auto second = engine.startLoadTest(profile);
    EXPECT_NE(first.runId, second.runId);

    auto firstReport = first.result.get();
    auto secondReport = second.result.get();

    for (const auto* report : {&firstReport, &secondReport}) {
        EXPECT_GE(report->summary.totalRequests, 10u);
        EXPECT_GE(report->summary.durationMs, 5000.0);
        EXPECT_FALSE(report->cancelled);
    }

    auto history = engine.getTestResults();
    ASSERT_EQ(history.size(), 2u);
    std::set<std::string> ids = {history[0].runId, history[1].runId};
    EXPECT_EQ(ids, (std::set<std::string>{first.runId, second.runId}));
}

TEST_F(LoadTestEngineTest, CertainFailureOverrideFailsRun) {
    LoadTestEngine engine(fastConfig());
    auto profile = WorkloadProfile::create(2, 0.5, 0, "api");
    profile.overrides.failureProbability = 1.0;

    auto report = engine.runLoadTest(profile);

    ASSERT_GT(report.summary.totalRequests, 0u);
    EXPECT_EQ(report.summary.successfulRequests, 0u);
    EXPECT_DOUBLE_EQ(report.summary.errorRatePercent, 100.0);
    EXPECT_EQ(report.status, TestStatus::FAIL);
    EXPECT_FALSE(report.recommendations.empty());
    ASSERT_EQ(report.summary.errors.size(), 1u);
    EXPECT_EQ(report.summary.errors[0], engine.config().simulators.settingsFor(
                                            WorkloadType::API_CALL).errorMessage);
}

TEST_F(LoadTestEngineTest, StopTestEndsRunPromptly) {
    LoadTestEngine engine(fastConfig());
    auto start = std::chrono::steady_clock::now();
    auto pending = engine.startLoadTest(WorkloadProfile::create(5, 60, 10, "generic"));

    auto active = engine.getActiveRunIds();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0], pending.runId);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    auto stoppedAt = std::chrono::steady_clock::now();
    engine.stopTest(pending.runId);
    auto report = pending.result.get();

    // One worst-case iteration: 15 ms latency plus 10 ms jitter, with scheduling slack
    EXPECT_LT(elapsedMs(stoppedAt), 15.0 + 10.0 + 500.0);
    EXPECT_TRUE(report.cancelled);
    EXPECT_LT(elapsedMs(start), 5000.0);
    EXPECT_LT(report.summary.durationMs, 5000.0);
    EXPECT_TRUE(engine.getActiveRunIds().empty());
    EXPECT_EQ(engine.getTestResults().size(), 1u);
}

TEST_F(LoadTestEngineTest, StopUnknownRunIsIgnored) {
    auto engine = deterministicEngine();
    EXPECT_NO_THROW(engine->stopTest("load-test-0-999"));
    EXPECT_NO_THROW(engine->stopAll());
}

TEST_F(LoadTestEngineTest, StopAllCancelsEveryActiveRun) {
    LoadTestEngine engine(fastConfig());
    auto a = engine.startLoadTest(WorkloadProfile::create(2, 60, 0, "generic"));
    auto b = engine.startLoadTest(WorkloadProfile::create(2, 60, 0, "component"));

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    engine.stopAll();

    EXPECT_TRUE(a.result.get().cancelled);
    EXPECT_TRUE(b.result.get().cancelled);
}

TEST_F(LoadTestEngineTest, ProbeFailureBecomesFailedReport) {
    LoadTestEngine engine(fastConfig(), std::make_shared<test::FixedRandomSource>(),
                          std::make_shared<test::FailingProbe>(0));

    auto report = engine.runLoadTest(WorkloadProfile::create(1, 0.1, 0, "generic"));

    EXPECT_EQ(report.status, TestStatus::FAIL);
    ASSERT_TRUE(report.engineError.has_value());
    EXPECT_EQ(*report.engineError, "resource probe unavailable");
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations[0], ReportGenerator::engineFailureRecommendation());
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(engine.getTestResults().size(), 1u);
    EXPECT_TRUE(engine.getActiveRunIds().empty());
}

TEST_F(LoadTestEngineTest, MidRunSnapshotFailureBecomesFailedReport) {
    auto config = fastConfig();
    config.snapshotProbability = 1.0;
    LoadTestEngine engine(config, std::make_shared<test::FixedRandomSource>(),
                          std::make_shared<test::FailingProbe>(3));

    // Call 0 is the baseline, the failure hits a snapshot taken by a running user
    auto report = engine.runLoadTest(WorkloadProfile::create(5, 1, 0, "generic"));

    EXPECT_EQ(report.status, TestStatus::FAIL);
    ASSERT_TRUE(report.engineError.has_value());
    EXPECT_EQ(*report.engineError, "resource probe unavailable");
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations[0], ReportGenerator::engineFailureRecommendation());
    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(engine.getTestResults().size(), 1u);
    EXPECT_TRUE(engine.getActiveRunIds().empty());
}

TEST_F(LoadTestEngineTest, StandardExceptionBecomesInternalEngineError) {
    LoadTestEngine engine(fastConfig(), std::make_shared<test::FixedRandomSource>(),
                          std::make_shared<test::CrashingSampler>());

    auto report = engine.runLoadTest(WorkloadProfile::create(1, 0.1, 0, "generic"));

    EXPECT_EQ(report.status, TestStatus::FAIL);
    ASSERT_TRUE(report.engineError.has_value());
    EXPECT_EQ(*report.engineError, "Internal engine error: procfs read failed");
    ASSERT_EQ(report.recommendations.size(), 1u);
    EXPECT_EQ(report.recommendations[0], ReportGenerator::engineFailureRecommendation());
    EXPECT_EQ(engine.getTestResults().size(), 1u);
    EXPECT_TRUE(engine.getActiveRunIds().empty());
}

TEST_F(LoadTestEngineTest, HistoryKeepsMostRecentReports) {
    auto engine = deterministicEngine(2);
    for (int i = 0; i < 3; ++i) {
        engine->runLoadTest(WorkloadProfile::create(1, 0, 0, "generic"), "run-" + std::to_string(i));
    }

    auto history = engine->getTestResults();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].runId, "run-1");
    EXPECT_EQ(history[1].runId, "run-2");

    engine->clearResults();
    EXPECT_TRUE(engine->getTestResults().empty());

    engine->runLoadTest(WorkloadProfile::create(1, 0, 0, "generic"), "run-3");
    EXPECT_EQ(engine->getTestResults().size(), 1u);
}

TEST_F(LoadTestEngineTest, ZeroDurationRunHasNoRequests) {
    auto engine = deterministicEngine();
    auto report = engine->runLoadTest(WorkloadProfile::create(3, 0, 0, "analytics"));

    EXPECT_EQ(report.summary.totalRequests, 0u);
    EXPECT_DOUBLE_EQ(report.summary.errorRatePercent, 0.0);
    EXPECT_DOUBLE_EQ(report.summary.throughputReqPerSec, 0.0);
    EXPECT_EQ(report.status, TestStatus::PASS);
}

TEST_F(LoadTestEngineTest, RunIdsMustBeUniqueAndNonEmpty) {
    auto engine = deterministicEngine();
    auto profile = WorkloadProfile::create(1, 0, 0, "generic");

    EXPECT_THROW(engine->runLoadTest(profile, ""), ConfigurationException);

    auto pending = engine->startLoadTest(WorkloadProfile::create(1, 60, 0, "generic"));
    try {
        engine->runLoadTest(profile, pending.runId);
        ADD_FAILURE() << "duplicate run id accepted";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::RUN_ALREADY_ACTIVE);
    }
    engine->stopTest(pending.runId);
    EXPECT_TRUE(pending.result.get().cancelled);

    // Finished ids can be reused
    EXPECT_NO_THROW(engine->runLoadTest(profile, pending.runId));
}

TEST_F(LoadTestEngineTest, GeneratedRunIdsAreDistinct) {
    auto engine = deterministicEngine();
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        ids.insert(engine->nextRunId());
    }
    EXPECT_EQ(ids.size(), 50u);
}

TEST_F(LoadTestEngineTest, InvalidEngineConfigThrows) {
    EngineConfig config;
    config.historyCapacity = 0;
    EXPECT_THROW(LoadTestEngine{config}, ConfigurationException);

    config = EngineConfig{};
    config.jitterMinMs = 200;
    config.jitterMaxMs = 100;
    EXPECT_THROW(LoadTestEngine{config}, ConfigurationException);
}

TEST_F(LoadTestEngineTest, ReportSerializesToJson) {
    auto engine = deterministicEngine();
    auto report = engine->runLoadTest(WorkloadProfile::create(1, 0.1, 0, "api"), "json-run");

    auto json = report.toJson();
    EXPECT_EQ(json["runId"], "json-run");
    EXPECT_EQ(json["status"], "PASS");
    EXPECT_TRUE(json.contains("summary"));
    EXPECT_TRUE(json.contains("recommendations"));
    EXPECT_FALSE(report.summarize().empty());
}

} // namespace loadplus
