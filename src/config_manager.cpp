#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace loadplus {

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json jsonConfig;
  try {
    file >> jsonConfig;
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  bool result = applyJson(jsonConfig);
  if (result) {
    std::lock_guard<std::mutex> lock(mutex_);
    configFilePath = configPath; // Store for reload functionality
    CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                    configData.size());
  }
  return result;
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig;
  try {
    jsonConfig = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
  return applyJson(jsonConfig);
}

bool ConfigManager::reloadConfiguration() {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    path = configFilePath;
  }
  if (path.empty()) {
    CONFIG_LOG_ERROR("No configuration file path available for reload");
    return false;
  }

  CONFIG_LOG_INFO("Reloading configuration from: {}", path);
  return loadConfig(path);
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  configData.clear();
  rawConfig_ = nlohmann::json::object();
  configFilePath.clear();
}

bool ConfigManager::applyJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  configData.clear();
  rawConfig_ = jsonConfig;

  // Flatten JSON into dot-separated keys
  flattenJson(jsonConfig, "", 0, 100);
  return true;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData.find(key); it != configData.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return configData.find(key) != configData.end();
}

std::unordered_set<std::string>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string> result;
  std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    try {
      auto arr = nlohmann::json::parse(raw);
      if (arr.is_array()) {
        for (const auto &v : arr) {
          if (v.is_string()) result.insert(v.get<std::string>());
        }
        return result;
      }
    } catch (const nlohmann::json::exception &e) {
      CONFIG_LOG_WARN("Key {} is not a JSON array ({}), reading it as CSV",
                      key, e.what());
    }
  }

  std::string value = raw;
  if (value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.length() - 2);
  }
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty()) result.insert(item);
  }
  return result;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLogLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/loadplus.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");
  config.includeMetrics = getBool("logging.include_metrics", false);

  return config;
}

EngineConfig ConfigManager::getEngineConfig() const {
  return EngineConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result = getEngineConfig().validate();

  auto logConfig = getLoggingConfig();
  if (logConfig.maxBackupFiles < 0) {
    result.addError("logging.max_backup_files must not be negative");
  }
  if (logConfig.fileOutput && logConfig.logFile.empty()) {
    result.addError("logging.log_file must be set when file output is enabled");
  }

  return result;
}

nlohmann::json ConfigManager::getJsonConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rawConfig_;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_array()) {
      // Arrays are kept as JSON text, see getStringSet()
      configData[key] = it->dump();
    } else if (it->is_string()) {
      configData[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData[key] = it->get<bool>() ? "true" : "false";
    } else {
      configData[key] = it->dump();
    }
  }
}

// ===== EngineConfig Implementation =====

namespace {

// Full uint32 range; anything else falls back to 0 (nondeterministic)
std::uint32_t parseRandomSeed(const std::string &text) {
  if (text.empty() || text.find('-') != std::string::npos) {
    CONFIG_LOG_WARN("engine.random_seed '{}' is not a non-negative integer, using 0", text);
    return 0;
  }
  size_t consumed = 0;
  unsigned long long seed = 0;
  try {
    seed = std::stoull(text, &consumed);
  } catch (const std::logic_error &) { // invalid_argument, out_of_range
    consumed = 0;
  }
  if (consumed == text.size() &&
      seed <= std::numeric_limits<std::uint32_t>::max()) {
    return static_cast<std::uint32_t>(seed);
  }
  CONFIG_LOG_WARN("engine.random_seed '{}' is outside 0..{}, using 0", text,
                  std::numeric_limits<std::uint32_t>::max());
  return 0;
}

} // namespace

EngineConfig EngineConfig::fromConfig(const ConfigManager &config) {
  EngineConfig engineConfig;

  engineConfig.historyCapacity =
      config.getInt("engine.history_capacity", engineConfig.historyCapacity);
  engineConfig.snapshotProbability = config.getDouble(
      "engine.snapshot_probability", engineConfig.snapshotProbability);
  engineConfig.jitterMinMs =
      config.getDouble("engine.jitter_min_ms", engineConfig.jitterMinMs);
  engineConfig.jitterMaxMs =
      config.getDouble("engine.jitter_max_ms", engineConfig.jitterMaxMs);
  engineConfig.randomSeed =
      parseRandomSeed(config.getString("engine.random_seed", "0"));

  auto &t = engineConfig.thresholds;
  t.failErrorRatePercent =
      config.getDouble("report.fail_error_rate_percent", t.failErrorRatePercent);
  t.failMemoryGrowthMB =
      config.getDouble("report.fail_memory_growth_mb", t.failMemoryGrowthMB);
  t.warnErrorRatePercent =
      config.getDouble("report.warn_error_rate_percent", t.warnErrorRatePercent);
  t.warnLatencyMs = config.getDouble("report.warn_latency_ms", t.warnLatencyMs);
  t.warnMemoryGrowthMB =
      config.getDouble("report.warn_memory_growth_mb", t.warnMemoryGrowthMB);

  for (auto type : allWorkloadTypes()) {
    const std::string prefix = "simulators." + workloadTypeToString(type) + ".";
    SimulatorSettings settings = engineConfig.simulators.settingsFor(type);
    settings.minLatencyMs =
        config.getDouble(prefix + "min_latency_ms", settings.minLatencyMs);
    settings.maxLatencyMs =
        config.getDouble(prefix + "max_latency_ms", settings.maxLatencyMs);
    settings.failureProbability = config.getDouble(
        prefix + "failure_probability", settings.failureProbability);
    settings.errorMessage =
        config.getString(prefix + "error_message", settings.errorMessage);
    engineConfig.simulators.setSettings(type, std::move(settings));
  }

  return engineConfig;
}

ConfigValidationResult EngineConfig::validate() const {
  ConfigValidationResult result;

  if (historyCapacity < 1) {
    std::stringstream ss;
    ss << "engine.history_capacity must be at least 1, got: "
       << historyCapacity;
    result.addError(ss.str());
  } else if (historyCapacity > 10000) {
    std::stringstream ss;
    ss << "engine.history_capacity is very high (" << historyCapacity
       << "), reports are kept in memory";
    result.addWarning(ss.str());
  }

  if (snapshotProbability < 0.0 || snapshotProbability > 1.0) {
    std::stringstream ss;
    ss << "engine.snapshot_probability must be within [0, 1], got: "
       << snapshotProbability;
    result.addError(ss.str());
  }

  if (jitterMinMs < 0.0 || jitterMaxMs < jitterMinMs) {
    std::stringstream ss;
    ss << "engine jitter range is invalid: [" << jitterMinMs << ", "
       << jitterMaxMs << "] ms";
    result.addError(ss.str());
  }

  if (thresholds.failErrorRatePercent < 0.0 ||
      thresholds.warnErrorRatePercent < 0.0 || thresholds.warnLatencyMs < 0.0 ||
      thresholds.failMemoryGrowthMB < 0.0 ||
      thresholds.warnMemoryGrowthMB < 0.0) {
    result.addError("report thresholds must not be negative");
  }

  if (thresholds.warnErrorRatePercent > thresholds.failErrorRatePercent) {
    result.addWarning("report.warn_error_rate_percent is above "
                      "report.fail_error_rate_percent, WARNING is unreachable "
                      "for error rate");
  }
  if (thresholds.warnMemoryGrowthMB > thresholds.failMemoryGrowthMB) {
    result.addWarning("report.warn_memory_growth_mb is above "
                      "report.fail_memory_growth_mb, WARNING is unreachable "
                      "for memory growth");
  }

  for (auto type : allWorkloadTypes()) {
    const auto &settings = simulators.settingsFor(type);
    const std::string name = "simulators." + workloadTypeToString(type);
    if (settings.minLatencyMs < 0.0 ||
        settings.maxLatencyMs < settings.minLatencyMs) {
      std::stringstream ss;
      ss << name << " latency range is invalid: [" << settings.minLatencyMs
         << ", " << settings.maxLatencyMs << "] ms";
      result.addError(ss.str());
    }
    if (settings.failureProbability < 0.0 ||
        settings.failureProbability > 1.0) {
      std::stringstream ss;
      ss << name << ".failure_probability must be within [0, 1], got: "
         << settings.failureProbability;
      result.addError(ss.str());
    }
  }

  return result;
}

SchedulerSettings EngineConfig::schedulerSettings() const {
  SchedulerSettings settings;
  settings.jitterMinMs = jitterMinMs;
  settings.jitterMaxMs = jitterMaxMs;
  settings.snapshotProbability = snapshotProbability;
  return settings;
}

} // namespace loadplus
