#include <gtest/gtest.h>
#include "load_test_suite.hpp"
#include "test_doubles.hpp"
#include <chrono>
#include <thread>

namespace loadplus {

class LoadTestSuiteTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::configureQuietLogging();

        EngineConfig config;
        config.jitterMinMs = 5;
        config.jitterMaxMs = 5;
        for (auto type : allWorkloadTypes()) {
            config.simulators.setSettings(type, SimulatorSettings{5, 5, 0.0, "failed"});
        }
        engine_ = std::make_unique<LoadTestEngine>(
            config, std::make_shared<test::FixedRandomSource>(),
            std::make_shared<test::ScriptedProbe>(std::vector<double>{64.0}));
    }

    std::unique_ptr<LoadTestEngine> engine_;
};

TEST_F(LoadTestSuiteTest, QuickPreset) {
    auto suite = LoadTestSuite::quick();
    EXPECT_EQ(suite.name(), "quick");
    ASSERT_EQ(suite.entries().size(), 3u);

    const auto& first = suite.entries()[0].profile;
    EXPECT_EQ(first.concurrency, 3);
    EXPECT_DOUBLE_EQ(first.duration, 10);
    EXPECT_DOUBLE_EQ(first.rampUpSeconds, 2);
    EXPECT_EQ(first.workloadType, WorkloadType::COMPONENT);
    EXPECT_EQ(suite.entries()[1].profile.workloadType, WorkloadType::UI_INTERACTION);
    EXPECT_EQ(suite.entries()[2].profile.workloadType, WorkloadType::ANALYTICS);

    for (const auto& entry : suite.entries()) {
        EXPECT_NO_THROW(entry.profile.validate());
    }
}

TEST_F(LoadTestSuiteTest, ComprehensivePresetStatistics) {
    auto suite = LoadTestSuite::comprehensive();
    auto stats = suite.getStatistics();

    EXPECT_EQ(stats.totalTests, 6u);
    EXPECT_EQ(stats.byType.size(), 6u);
    EXPECT_EQ(stats.byType.at("api-call"), 1u);
    EXPECT_EQ(stats.byType.at("analytics-concurrent"), 1u);
    // 30+5 + 20+3 + 35+5 + 25+3 + 25+4 + 40+6
    EXPECT_DOUBLE_EQ(stats.estimatedDurationSeconds, 201.0);
}

TEST_F(LoadTestSuiteTest, ByNameResolvesPresets) {
    EXPECT_EQ(LoadTestSuite::byName("quick").entries().size(), 3u);
    EXPECT_EQ(LoadTestSuite::byName("comprehensive").entries().size(), 6u);

    try {
        LoadTestSuite::byName("nightly");
        ADD_FAILURE() << "unknown suite accepted";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getField(), "suite");
        EXPECT_EQ(e.getCode(), ErrorCode::INVALID_INPUT);
    }
}

TEST_F(LoadTestSuiteTest, FilterByTypeKeepsOrderAndRenames) {
    auto filtered = LoadTestSuite::comprehensive().filterByType(WorkloadType::ANALYTICS);
    EXPECT_EQ(filtered.name(), "comprehensive/analytics");
    ASSERT_EQ(filtered.entries().size(), 1u);
    EXPECT_EQ(filtered.entries()[0].name, "Analytics processing");

    auto none = LoadTestSuite::quick().filterByType(WorkloadType::RESEARCH_QUESTION);
    EXPECT_TRUE(none.entries().empty());
    EXPECT_EQ(none.getStatistics().totalTests, 0u);
}

TEST_F(LoadTestSuiteTest, RunsEntriesInOrder) {
    LoadTestSuite suite("smoke", {
        {"first", WorkloadProfile::create(1, 0.1, 0, "component")},
        {"second", WorkloadProfile::create(2, 0.1, 0, "api-call")}
    });

    auto result = suite.run(*engine_);

    EXPECT_EQ(result.suiteName, "smoke");
    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.reports[0].config.workloadType, WorkloadType::COMPONENT);
    EXPECT_EQ(result.reports[1].config.workloadType, WorkloadType::API_CALL);
    EXPECT_EQ(result.overallStatus, TestStatus::PASS);
    EXPECT_FALSE(result.stoppedEarly);
    EXPECT_EQ(engine_->getTestResults().size(), 2u);

    auto json = result.toJson();
    EXPECT_EQ(json["suite"], "smoke");
    EXPECT_EQ(json["reports"].size(), 2u);
}

TEST_F(LoadTestSuiteTest, OverallStatusIsWorstReport) {
    auto failing = WorkloadProfile::create(1, 0.1, 0, "generic");
    failing.overrides.failureProbability = 1.0;
    LoadTestSuite suite("mixed", {
        {"healthy", WorkloadProfile::create(1, 0.1, 0, "generic")},
        {"failing", failing}
    });

    auto result = suite.run(*engine_);

    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.reports[0].status, TestStatus::PASS);
    EXPECT_EQ(result.reports[1].status, TestStatus::FAIL);
    EXPECT_EQ(result.overallStatus, TestStatus::FAIL);
}

TEST_F(LoadTestSuiteTest, StopCancelsCurrentAndSkipsRemaining) {
    LoadTestSuite suite("long", {
        {"one", WorkloadProfile::create(2, 60, 0, "generic")},
        {"two", WorkloadProfile::create(2, 60, 0, "generic")},
        {"three", WorkloadProfile::create(2, 60, 0, "generic")}
    });

    std::thread stopper([&suite]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        suite.stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = suite.run(*engine_);
    stopper.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.stoppedEarly);
    EXPECT_TRUE(suite.isStopped());
    ASSERT_EQ(result.reports.size(), 1u);
    EXPECT_TRUE(result.reports[0].cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(LoadTestSuiteTest, StopBeforeRunSkipsEveryTest) {
    LoadTestSuite suite("interrupted", {
        {"one", WorkloadProfile::create(1, 0.1, 0, "generic")},
        {"two", WorkloadProfile::create(1, 0.1, 0, "generic")}
    });

    suite.stop();
    auto result = suite.run(*engine_);

    EXPECT_TRUE(result.stoppedEarly);
    EXPECT_TRUE(result.reports.empty());
    EXPECT_EQ(result.overallStatus, TestStatus::PASS);
    EXPECT_TRUE(engine_->getTestResults().empty());
}

} // namespace loadplus
