#include "workload_profile.hpp"
#include "load_exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace loadplus {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::unordered_map<std::string, WorkloadType>& workloadNameTable() {
    static const std::unordered_map<std::string, WorkloadType> table = {
        {"component", WorkloadType::COMPONENT},
        {"data-processing", WorkloadType::DATA_PROCESSING},
        {"ui-interaction", WorkloadType::UI_INTERACTION},
        {"api-call", WorkloadType::API_CALL},
        {"api", WorkloadType::API_CALL},
        {"analytics", WorkloadType::ANALYTICS},
        {"analytics-processing", WorkloadType::ANALYTICS},
        {"analytics-concurrent", WorkloadType::ANALYTICS_CONCURRENT},
        {"research-question", WorkloadType::RESEARCH_QUESTION},
        {"context-processing", WorkloadType::CONTEXT_PROCESSING},
        {"generic", WorkloadType::GENERIC}
    };
    return table;
}

void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw ConfigurationException(ErrorCode::INVALID_INPUT,
                                     std::string(field) + " must be a finite number",
                                     field, std::to_string(value));
    }
}

} // namespace

std::string workloadTypeToString(WorkloadType type) {
    switch (type) {
        case WorkloadType::COMPONENT: return "component";
        case WorkloadType::DATA_PROCESSING: return "data-processing";
        case WorkloadType::UI_INTERACTION: return "ui-interaction";
        case WorkloadType::API_CALL: return "api-call";
        case WorkloadType::ANALYTICS: return "analytics";
        case WorkloadType::ANALYTICS_CONCURRENT: return "analytics-concurrent";
        case WorkloadType::RESEARCH_QUESTION: return "research-question";
        case WorkloadType::CONTEXT_PROCESSING: return "context-processing";
        case WorkloadType::GENERIC: return "generic";
        default: return "generic";
    }
}

WorkloadType parseWorkloadType(const std::string& name) {
    const auto& table = workloadNameTable();
    auto it = table.find(toLower(name));
    return it != table.end() ? it->second : WorkloadType::GENERIC;
}

bool isKnownWorkloadType(const std::string& name) {
    return workloadNameTable().count(toLower(name)) > 0;
}

const std::vector<WorkloadType>& allWorkloadTypes() {
    static const std::vector<WorkloadType> types = {
        WorkloadType::COMPONENT,
        WorkloadType::DATA_PROCESSING,
        WorkloadType::UI_INTERACTION,
        WorkloadType::API_CALL,
        WorkloadType::ANALYTICS,
        WorkloadType::ANALYTICS_CONCURRENT,
        WorkloadType::RESEARCH_QUESTION,
        WorkloadType::CONTEXT_PROCESSING,
        WorkloadType::GENERIC
    };
    return types;
}

WorkloadProfile WorkloadProfile::create(int concurrency, double duration,
                                        double rampUpSeconds,
                                        const std::string& workloadName) {
    WorkloadProfile profile;
    profile.concurrency = concurrency;
    profile.duration = duration;
    profile.rampUpSeconds = rampUpSeconds;
    profile.workloadType = parseWorkloadType(workloadName);
    profile.workloadName = workloadName;
    return profile;
}

void WorkloadProfile::validate() const {
    if (concurrency < 1) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "concurrency must be at least 1",
                                     "concurrency", std::to_string(concurrency));
    }

    requireFinite(duration, "duration");
    if (duration < 0.0) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "duration must not be negative",
                                     "duration", std::to_string(duration));
    }

    requireFinite(rampUpSeconds, "rampUpSeconds");
    if (rampUpSeconds < 0.0) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "rampUpSeconds must not be negative",
                                     "rampUpSeconds", std::to_string(rampUpSeconds));
    }

    if (overrides.minLatencyMs && (!std::isfinite(*overrides.minLatencyMs) || *overrides.minLatencyMs < 0.0)) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "minimum latency override must be a non-negative number",
                                     "overrides.minLatencyMs",
                                     std::to_string(*overrides.minLatencyMs));
    }
    if (overrides.maxLatencyMs && (!std::isfinite(*overrides.maxLatencyMs) || *overrides.maxLatencyMs < 0.0)) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "maximum latency override must be a non-negative number",
                                     "overrides.maxLatencyMs",
                                     std::to_string(*overrides.maxLatencyMs));
    }
    if (overrides.minLatencyMs && overrides.maxLatencyMs &&
        *overrides.minLatencyMs > *overrides.maxLatencyMs) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "minimum latency override exceeds maximum latency override",
                                     "overrides.minLatencyMs",
                                     std::to_string(*overrides.minLatencyMs));
    }
    if (overrides.failureProbability &&
        !(*overrides.failureProbability >= 0.0 && *overrides.failureProbability <= 1.0)) {
        throw ConfigurationException(ErrorCode::INVALID_RANGE,
                                     "failure probability override must be within [0, 1]",
                                     "overrides.failureProbability",
                                     std::to_string(*overrides.failureProbability));
    }
}

std::string WorkloadProfile::displayName() const {
    return workloadName.empty() ? workloadTypeToString(workloadType) : workloadName;
}

nlohmann::json WorkloadProfile::toJson() const {
    nlohmann::json json = {
        {"concurrency", concurrency},
        {"duration", duration},
        {"rampUpSeconds", rampUpSeconds},
        {"workloadType", displayName()},
        {"simulator", workloadTypeToString(workloadType)}
    };

    if (!overrides.empty()) {
        nlohmann::json overrideJson = nlohmann::json::object();
        if (overrides.minLatencyMs) overrideJson["minLatencyMs"] = *overrides.minLatencyMs;
        if (overrides.maxLatencyMs) overrideJson["maxLatencyMs"] = *overrides.maxLatencyMs;
        if (overrides.failureProbability) overrideJson["failureProbability"] = *overrides.failureProbability;
        json["overrides"] = overrideJson;
    }

    return json;
}

} // namespace loadplus
