#pragma once

#include "error_codes.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace loadplus {

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

// Base exception with error code, context and correlation ID
class LoadTestException : public std::exception {
public:
  LoadTestException(ErrorCode code, std::string message,
                    ErrorContext context = {});

  LoadTestException(const LoadTestException &other) = default;
  LoadTestException &operator=(const LoadTestException &other) = default;
  LoadTestException(LoadTestException &&other) noexcept = default;
  LoadTestException &operator=(LoadTestException &&other) noexcept = default;

  virtual ~LoadTestException() = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  // Serialization for logging
  virtual std::string toLogString() const;

  void addContext(const std::string &key, const std::string &value);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

/**
 * Raised synchronously for an invalid workload profile or engine
 * configuration. Nothing has been scheduled when this is thrown.
 */
class ConfigurationException : public LoadTestException {
public:
  ConfigurationException(ErrorCode code, std::string message,
                         std::string field = "", std::string value = "",
                         ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

/**
 * A defect inside the engine itself (scheduler, aggregator, probes).
 * The engine converts it into a FAIL report at the run boundary.
 */
class EngineException : public LoadTestException {
public:
  EngineException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

ConfigurationException createConfigurationError(const std::string &field,
                                                const std::string &value,
                                                const std::string &reason);

EngineException createEngineError(ErrorCode code, const std::string &component,
                                  const std::string &details);

} // namespace loadplus
