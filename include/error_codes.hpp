#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace loadplus {

// Error codes grouped by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  INVALID_RANGE = 1002,

  // System errors (3000-3999)
  CONFIGURATION_ERROR = 3000,
  FILE_ERROR = 3001,
  INTERNAL_ERROR = 3002,

  // Run lifecycle errors (4000-4999)
  RUN_ALREADY_ACTIVE = 4001
};

// Error code metadata
struct ErrorCodeInfo {
  std::string description;
  std::string category;
  bool isRetryable;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

} // namespace loadplus

// Hash support for ErrorCode keys in unordered_map
namespace std {
template <> struct hash<loadplus::ErrorCode> {
  size_t operator()(const loadplus::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<loadplus::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std

namespace loadplus {
const char *getErrorCodeDescription(ErrorCode code);
std::string getErrorCategory(ErrorCode code);
bool isRetryableError(ErrorCode code);
std::string errorCodeToString(ErrorCode code);
} // namespace loadplus
