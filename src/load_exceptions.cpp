#include "load_exceptions.hpp"
#include <random>
#include <sstream>

namespace loadplus {

std::string LoadTestException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

LoadTestException::LoadTestException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string LoadTestException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_)
       << " (" << errorCodeToString(errorCode_) << ") "
       << "Category=" << getErrorCategory(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void LoadTestException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

ConfigurationException::ConfigurationException(ErrorCode code, std::string message,
                                               std::string field, std::string value,
                                               ErrorContext context)
    : LoadTestException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {

    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ConfigurationException::toLogString() const {
    std::stringstream ss;
    ss << "[CONFIGURATION] " << LoadTestException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    if (!value_.empty()) {
        ss << " Value=\"" << value_ << "\"";
    }
    return ss.str();
}

EngineException::EngineException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : LoadTestException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {

    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string EngineException::toLogString() const {
    std::stringstream ss;
    ss << "[ENGINE] " << LoadTestException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

ConfigurationException createConfigurationError(const std::string& field,
                                                const std::string& value,
                                                const std::string& reason) {
    ErrorContext context;
    context["reason"] = reason;
    return ConfigurationException(ErrorCode::INVALID_INPUT,
                                  "Invalid configuration: " + reason,
                                  field, value, context);
}

EngineException createEngineError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return EngineException(code, getErrorCodeDescription(code), component, context);
}

} // namespace loadplus
