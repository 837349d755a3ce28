#include "report_generator.hpp"
#include "logger.hpp"
#include <iomanip>
#include <sstream>

namespace loadplus {

namespace {

std::string formatNumber(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

} // namespace

ReportGenerator::ReportGenerator(ReportThresholds thresholds) : thresholds_(thresholds) {}

const std::string& ReportGenerator::engineFailureRecommendation() {
    static const std::string recommendation = "Fix critical errors before retesting";
    return recommendation;
}

Assessment ReportGenerator::assess(const PerformanceSummary& summary) const {
    Assessment result;
    const double errorRate = summary.errorRatePercent;
    const double growth = summary.memory.growthMB();

    bool errorRateFails = errorRate > thresholds_.failErrorRatePercent;
    bool memoryFails = growth > thresholds_.failMemoryGrowthMB;
    bool errorRateWarns = errorRate > thresholds_.warnErrorRatePercent;
    bool latencyWarns = summary.averageLatencyMs > thresholds_.warnLatencyMs;
    bool memoryWarns = growth > thresholds_.warnMemoryGrowthMB;

    if (errorRateFails || memoryFails) {
        result.status = TestStatus::FAIL;
    } else if (errorRateWarns || latencyWarns || memoryWarns) {
        result.status = TestStatus::WARNING;
    }

    if (errorRateFails) {
        result.recommendations.push_back(
            "Error rate of " + formatNumber(errorRate) +
            "% is critical: add retry with exponential backoff and fail fast on "
            "non-retryable errors");
    } else if (errorRateWarns) {
        result.recommendations.push_back(
            "Error rate of " + formatNumber(errorRate) +
            "% is elevated: consider retry with exponential backoff for transient failures");
    }

    if (latencyWarns) {
        result.recommendations.push_back(
            "Average latency of " + formatNumber(summary.averageLatencyMs) +
            " ms is high: consider caching repeated results or batching requests");
    }

    if (memoryFails) {
        result.recommendations.push_back(
            "Memory grew by " + formatNumber(growth) +
            " MB: audit event listeners and subscriptions for missing cleanup");
    } else if (memoryWarns) {
        result.recommendations.push_back(
            "Memory grew by " + formatNumber(growth) +
            " MB: check that listeners and subscriptions are released after use");
    }

    if (result.status != TestStatus::PASS) {
        REPORT_LOG_WARN("Assessment {} with {} recommendation(s)",
                        testStatusToString(result.status), result.recommendations.size());
    } else {
        REPORT_LOG_DEBUG("Assessment PASS");
    }
    return result;
}

} // namespace loadplus
