#pragma once

#include "logger.hpp"
#include "report_generator.hpp"
#include "virtual_user_scheduler.hpp"
#include "workload_simulator.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace loadplus {

// Forward declarations
class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

// Engine configuration structure
struct EngineConfig {
  int historyCapacity = 100;
  double snapshotProbability = 0.1;
  double jitterMinMs = 50.0;
  double jitterMaxMs = 150.0;
  std::uint32_t randomSeed = 0; // 0 = seed from std::random_device
  ReportThresholds thresholds;
  SimulatorCatalog simulators;

  static EngineConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;

  SchedulerSettings schedulerSettings() const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  bool reloadConfiguration();
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  std::unordered_set<std::string> getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  // Logging configuration helpers
  LogConfig getLoggingConfig() const;

  // Engine configuration helpers
  EngineConfig getEngineConfig() const;
  ConfigValidationResult validateConfiguration() const;

  // Get raw JSON configuration
  nlohmann::json getJsonConfig() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> configData;
  std::string configFilePath;
  nlohmann::json rawConfig_;

  bool applyJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
};

/**
 * @brief Retrieve a typed configuration value with optional validation.
 *
 * Supported types are `std::string`, `int`, `bool` and `double`. Returns
 * @p defaultValue when the key is missing or the validator rejects the
 * stored value.
 */
template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    return defaultValue;
  }

  return value;
}

} // namespace loadplus
