#include "error_codes.hpp"

namespace loadplus {

const std::unordered_map<ErrorCode, ErrorCodeInfo>& getErrorCodeInfo() {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
        // Validation errors
        {ErrorCode::INVALID_INPUT, {
            "Invalid input value",
            "Validation",
            false
        }},
        {ErrorCode::INVALID_RANGE, {
            "Value is outside acceptable range",
            "Validation",
            false
        }},

        // System errors
        {ErrorCode::CONFIGURATION_ERROR, {
            "Configuration loading or parsing failed",
            "System",
            false // Needs a corrected config file
        }},
        {ErrorCode::FILE_ERROR, {
            "File system operation failed",
            "System",
            true
        }},
        {ErrorCode::INTERNAL_ERROR, {
            "Internal engine error",
            "System",
            false
        }},

        // Run lifecycle errors
        {ErrorCode::RUN_ALREADY_ACTIVE, {
            "A load test run with this id is already active",
            "Run",
            true // Retry once the active run completes
        }}
    };

    return errorInfo;
}

const char* getErrorCodeDescription(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.description.c_str() : "Unknown error";
}

std::string getErrorCategory(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.category : "Unknown";
}

bool isRetryableError(ErrorCode code) {
    const auto& info = getErrorCodeInfo();
    auto it = info.find(code);
    return (it != info.end()) ? it->second.isRetryable : false;
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::INVALID_RANGE: return "INVALID_RANGE";
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        case ErrorCode::FILE_ERROR: return "FILE_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::RUN_ALREADY_ACTIVE: return "RUN_ALREADY_ACTIVE";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace loadplus
