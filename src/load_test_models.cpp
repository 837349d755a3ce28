#include "load_test_models.hpp"
#include "load_exceptions.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace loadplus {

namespace {

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

int severity(TestStatus status) {
    switch (status) {
        case TestStatus::PASS: return 0;
        case TestStatus::WARNING: return 1;
        case TestStatus::FAIL: return 2;
    }
    return 2;
}

} // namespace

std::string testStatusToString(TestStatus status) {
    switch (status) {
        case TestStatus::PASS: return "PASS";
        case TestStatus::WARNING: return "WARNING";
        case TestStatus::FAIL: return "FAIL";
        default: return "UNKNOWN";
    }
}

TestStatus worstStatus(TestStatus a, TestStatus b) {
    return severity(a) >= severity(b) ? a : b;
}

nlohmann::json PerformanceSummary::toJson() const {
    return {
        {"totalRequests", totalRequests},
        {"successfulRequests", successfulRequests},
        {"failedRequests", failedRequests},
        {"averageLatencyMs", averageLatencyMs},
        {"minLatencyMs", minLatencyMs},
        {"maxLatencyMs", maxLatencyMs},
        {"throughputReqPerSec", throughputReqPerSec},
        {"errorRatePercent", errorRatePercent},
        {"memory", {
            {"initial", memory.initialMB},
            {"peak", memory.peakMB},
            {"final", memory.finalMB}
        }},
        {"cpuUtilization", cpuUtilization},
        {"durationMs", durationMs},
        {"errors", errors}
    };
}

nlohmann::json LoadTestReport::toJson() const {
    nlohmann::json json = summary.toJson();
    json["runId"] = runId;
    json["config"] = config.toJson();
    json["startTime"] = toEpochMillis(startTime);
    json["endTime"] = toEpochMillis(endTime);
    json["status"] = testStatusToString(status);
    json["recommendations"] = recommendations;
    json["cancelled"] = cancelled;
    if (engineError) {
        json["engineError"] = *engineError;
    }
    return json;
}

std::string LoadTestReport::summarize() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "Load test " << runId << " [" << testStatusToString(status) << "]"
        << (cancelled ? " (cancelled)" : "") << "\n"
        << "  workload:    " << config.displayName() << ", " << config.concurrency
        << " users, " << config.duration << "s + " << config.rampUpSeconds << "s ramp-up\n"
        << "  requests:    " << summary.totalRequests << " total, "
        << summary.successfulRequests << " ok, " << summary.failedRequests << " failed ("
        << summary.errorRatePercent << "%)\n"
        << "  latency:     avg " << summary.averageLatencyMs << "ms, min "
        << summary.minLatencyMs << "ms, max " << summary.maxLatencyMs << "ms\n"
        << "  throughput:  " << summary.throughputReqPerSec << " req/s over "
        << summary.durationMs << "ms\n"
        << "  memory:      " << summary.memory.initialMB << "MB -> " << summary.memory.finalMB
        << "MB (peak " << summary.memory.peakMB << "MB)\n";

    if (engineError) {
        out << "  engine error: " << *engineError << "\n";
    }
    for (const auto& recommendation : recommendations) {
        out << "  * " << recommendation << "\n";
    }
    return out.str();
}

nlohmann::json reportsToJson(const std::vector<LoadTestReport>& reports) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& report : reports) {
        array.push_back(report.toJson());
    }
    return array;
}

void writeReportsFile(const std::string& path, const std::vector<LoadTestReport>& reports) {
    std::ofstream out(path, std::ios::trunc);
    if (out.is_open()) {
        out << reportsToJson(reports).dump(2) << std::endl;
    }
    if (!out) {
        auto error = createEngineError(ErrorCode::FILE_ERROR, "ReportWriter",
                                       "Cannot write report file " + path);
        error.addContext("path", path);
        throw error;
    }
}

} // namespace loadplus
