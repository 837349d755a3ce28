#include <gtest/gtest.h>
#include "load_exceptions.hpp"
#include "report_generator.hpp"
#include "test_doubles.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace loadplus {

class ReportGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override { test::configureQuietLogging(); }

    static PerformanceSummary summaryWith(double errorRate, double latencyMs, double growthMB) {
        PerformanceSummary summary;
        summary.totalRequests = 100;
        summary.errorRatePercent = errorRate;
        summary.averageLatencyMs = latencyMs;
        summary.memory.initialMB = 100.0;
        summary.memory.finalMB = 100.0 + growthMB;
        summary.memory.peakMB = std::max(summary.memory.initialMB, summary.memory.finalMB);
        return summary;
    }

    static bool mentions(const Assessment& assessment, const std::string& word) {
        return std::any_of(assessment.recommendations.begin(), assessment.recommendations.end(),
                           [&word](const std::string& r) { return r.find(word) != std::string::npos; });
    }

    ReportGenerator generator_;
};

TEST_F(ReportGeneratorTest, HealthySummaryPasses) {
    auto assessment = generator_.assess(summaryWith(1.0, 200.0, 5.0));
    EXPECT_EQ(assessment.status, TestStatus::PASS);
    EXPECT_TRUE(assessment.recommendations.empty());
}

TEST_F(ReportGeneratorTest, ThresholdsAreExclusive) {
    // Exactly on a threshold does not breach it
    auto assessment = generator_.assess(summaryWith(5.0, 1000.0, 50.0));
    EXPECT_EQ(assessment.status, TestStatus::PASS);

    assessment = generator_.assess(summaryWith(15.0, 0.0, 0.0));
    EXPECT_EQ(assessment.status, TestStatus::WARNING);
}

TEST_F(ReportGeneratorTest, ElevatedErrorRateWarnsWithRetryAdvice) {
    auto assessment = generator_.assess(summaryWith(8.0, 100.0, 0.0));
    EXPECT_EQ(assessment.status, TestStatus::WARNING);
    ASSERT_EQ(assessment.recommendations.size(), 1u);
    EXPECT_TRUE(mentions(assessment, "retry"));
}

TEST_F(ReportGeneratorTest, SlowLatencyWarnsWithCachingAdvice) {
    auto assessment = generator_.assess(summaryWith(0.0, 1500.0, 0.0));
    EXPECT_EQ(assessment.status, TestStatus::WARNING);
    EXPECT_TRUE(mentions(assessment, "caching"));
}

TEST_F(ReportGeneratorTest, MemoryGrowthWarnsThenFails) {
    auto warning = generator_.assess(summaryWith(0.0, 10.0, 60.0));
    EXPECT_EQ(warning.status, TestStatus::WARNING);
    EXPECT_TRUE(mentions(warning, "listeners"));

    auto failure = generator_.assess(summaryWith(0.0, 10.0, 150.0));
    EXPECT_EQ(failure.status, TestStatus::FAIL);
    ASSERT_EQ(failure.recommendations.size(), 1u);
    EXPECT_TRUE(mentions(failure, "listeners"));
}

TEST_F(ReportGeneratorTest, HighErrorRateFails) {
    auto assessment = generator_.assess(summaryWith(100.0, 10.0, 0.0));
    EXPECT_EQ(assessment.status, TestStatus::FAIL);
    EXPECT_TRUE(mentions(assessment, "backoff"));
}

TEST_F(ReportGeneratorTest, OneRecommendationPerBreachedMetric) {
    auto assessment = generator_.assess(summaryWith(20.0, 2000.0, 120.0));
    EXPECT_EQ(assessment.status, TestStatus::FAIL);
    EXPECT_EQ(assessment.recommendations.size(), 3u);
}

TEST_F(ReportGeneratorTest, CustomThresholds) {
    ReportThresholds strict;
    strict.warnErrorRatePercent = 0.5;
    strict.failErrorRatePercent = 1.0;
    ReportGenerator generator(strict);

    EXPECT_EQ(generator.assess(summaryWith(0.8, 0.0, 0.0)).status, TestStatus::WARNING);
    EXPECT_EQ(generator.assess(summaryWith(2.0, 0.0, 0.0)).status, TestStatus::FAIL);
}

TEST(TestStatusTest, WorstStatusOrdering) {
    EXPECT_EQ(worstStatus(TestStatus::PASS, TestStatus::WARNING), TestStatus::WARNING);
    EXPECT_EQ(worstStatus(TestStatus::FAIL, TestStatus::WARNING), TestStatus::FAIL);
    EXPECT_EQ(worstStatus(TestStatus::PASS, TestStatus::PASS), TestStatus::PASS);
    EXPECT_EQ(testStatusToString(TestStatus::WARNING), "WARNING");
}

TEST(ReportWriterTest, WritesReportsAsJsonArray) {
    auto path = (std::filesystem::temp_directory_path() /
                 ("loadplus_reports_" + std::to_string(::getpid()) + ".json")).string();
    LoadTestReport report;
    report.runId = "load-test-1-1";
    report.config = WorkloadProfile::create(1, 1, 0, "generic");

    writeReportsFile(path, {report, report});

    std::ifstream in(path);
    auto json = nlohmann::json::parse(in);
    ASSERT_TRUE(json.is_array());
    EXPECT_EQ(json.size(), 2u);
    EXPECT_EQ(json[0]["runId"], "load-test-1-1");
    std::filesystem::remove(path);
}

TEST(ReportWriterTest, UnwritablePathRaisesFileError) {
    const std::string path = "/nonexistent/loadplus/reports.json";
    try {
        writeReportsFile(path, {});
        ADD_FAILURE() << "write to missing directory succeeded";
    } catch (const EngineException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::FILE_ERROR);
        EXPECT_EQ(e.getComponent(), "ReportWriter");
        EXPECT_EQ(e.getContext().at("path"), path);
        EXPECT_TRUE(isRetryableError(e.getCode()));
    }
}

} // namespace loadplus
