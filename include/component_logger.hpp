#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace loadplus {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class LoadTestEngine> {
  static constexpr const char *name = "LoadTestEngine";
};

template <> struct ComponentTrait<class LoadTestSuite> {
  static constexpr const char *name = "LoadTestSuite";
};

template <> struct ComponentTrait<class ReportGenerator> {
  static constexpr const char *name = "ReportGenerator";
};

template <> struct ComponentTrait<class ResultAggregator> {
  static constexpr const char *name = "ResultAggregator";
};

template <> struct ComponentTrait<class SampleCollector> {
  static constexpr const char *name = "SampleCollector";
};

template <> struct ComponentTrait<class StopSignalHandler> {
  static constexpr const char *name = "StopSignalHandler";
};

template <> struct ComponentTrait<class SystemMetrics> {
  static constexpr const char *name = "SystemMetrics";
};

template <> struct ComponentTrait<class VirtualUserScheduler> {
  static constexpr const char *name = "VirtualUserScheduler";
};

template <> struct ComponentTrait<class WorkloadSimulator> {
  static constexpr const char *name = "WorkloadSimulator";
};

/**
 * ComponentLogger - compile-time component names for Logger calls.
 *
 * Messages may contain "{}" placeholders that are replaced in order by the
 * extra arguments:
 *
 *   EngineLogger::info("Run {} finished with {} samples", runId, count);
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    getLogger().fatal(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  // Run-scoped logging

  template <typename... Args>
  static void debugRun(const std::string &message, const std::string &runId,
                       Args &&...args) {
    getLogger().debugForRun(
        component_name, format_message(message, std::forward<Args>(args)...),
        runId);
  }

  template <typename... Args>
  static void infoRun(const std::string &message, const std::string &runId,
                      Args &&...args) {
    getLogger().infoForRun(
        component_name, format_message(message, std::forward<Args>(args)...),
        runId);
  }

  template <typename... Args>
  static void errorRun(const std::string &message, const std::string &runId,
                       Args &&...args) {
    getLogger().errorForRun(
        component_name, format_message(message, std::forward<Args>(args)...),
        runId);
  }

  static void logPerformance(const std::string &operation, double durationMs,
                             const LogContext &context = {}) {
    getLogger().logPerformance(operation, durationMs, context);
  }

  static void logMetric(const std::string &name, double value,
                        const std::string &unit = "") {
    getLogger().logMetric(name, value, unit);
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  static std::string format_message(const std::string &format) {
    return format;
  }

  template <typename... Args>
  static std::string format_message(const std::string &format, Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos == std::string::npos) {
      ss << format;
      return;
    }
    ss << format.substr(0, pos);
    stream_value(ss, std::forward<T>(arg));
    if constexpr (sizeof...(args) > 0) {
      format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
    } else {
      ss << format.substr(pos + 2);
    }
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using EngineLogger = ComponentLogger<class LoadTestEngine>;
using SuiteLogger = ComponentLogger<class LoadTestSuite>;
using ReportLogger = ComponentLogger<class ReportGenerator>;
using AggregatorLogger = ComponentLogger<class ResultAggregator>;
using CollectorLogger = ComponentLogger<class SampleCollector>;
using SignalLogger = ComponentLogger<class StopSignalHandler>;
using SystemMetricsLogger = ComponentLogger<class SystemMetrics>;
using SchedulerLogger = ComponentLogger<class VirtualUserScheduler>;
using SimulatorLogger = ComponentLogger<class WorkloadSimulator>;

} // namespace loadplus

#define CONFIG_LOG_INFO(message, ...)                                          \
  loadplus::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  loadplus::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  loadplus::ConfigLogger::error(message, ##__VA_ARGS__)

#define ENGINE_LOG_DEBUG(message, ...)                                         \
  loadplus::EngineLogger::debug(message, ##__VA_ARGS__)
#define ENGINE_LOG_INFO(message, ...)                                          \
  loadplus::EngineLogger::info(message, ##__VA_ARGS__)
#define ENGINE_LOG_WARN(message, ...)                                          \
  loadplus::EngineLogger::warn(message, ##__VA_ARGS__)
#define ENGINE_LOG_ERROR(message, ...)                                         \
  loadplus::EngineLogger::error(message, ##__VA_ARGS__)

#define ENGINE_LOG_INFO_RUN(message, runId, ...)                               \
  loadplus::EngineLogger::infoRun(message, runId, ##__VA_ARGS__)
#define ENGINE_LOG_ERROR_RUN(message, runId, ...)                              \
  loadplus::EngineLogger::errorRun(message, runId, ##__VA_ARGS__)

#define SCHED_LOG_DEBUG(message, ...)                                          \
  loadplus::SchedulerLogger::debug(message, ##__VA_ARGS__)
#define SCHED_LOG_DEBUG_RUN(message, runId, ...)                               \
  loadplus::SchedulerLogger::debugRun(message, runId, ##__VA_ARGS__)
#define SCHED_LOG_INFO_RUN(message, runId, ...)                                \
  loadplus::SchedulerLogger::infoRun(message, runId, ##__VA_ARGS__)

#define SIM_LOG_DEBUG(message, ...)                                            \
  loadplus::SimulatorLogger::debug(message, ##__VA_ARGS__)

#define COLLECTOR_LOG_DEBUG(message, ...)                                      \
  loadplus::CollectorLogger::debug(message, ##__VA_ARGS__)

#define AGGREGATOR_LOG_DEBUG(message, ...)                                     \
  loadplus::AggregatorLogger::debug(message, ##__VA_ARGS__)

#define REPORT_LOG_DEBUG(message, ...)                                         \
  loadplus::ReportLogger::debug(message, ##__VA_ARGS__)
#define REPORT_LOG_WARN(message, ...)                                          \
  loadplus::ReportLogger::warn(message, ##__VA_ARGS__)

#define METRICS_LOG_WARN(message, ...)                                         \
  loadplus::SystemMetricsLogger::warn(message, ##__VA_ARGS__)

#define SIGNAL_LOG_INFO(message, ...)                                          \
  loadplus::SignalLogger::info(message, ##__VA_ARGS__)
#define SIGNAL_LOG_WARN(message, ...)                                          \
  loadplus::SignalLogger::warn(message, ##__VA_ARGS__)
#define SIGNAL_LOG_ERROR(message, ...)                                         \
  loadplus::SignalLogger::error(message, ##__VA_ARGS__)

#define SUITE_LOG_INFO(message, ...)                                           \
  loadplus::SuiteLogger::info(message, ##__VA_ARGS__)
#define SUITE_LOG_WARN(message, ...)                                           \
  loadplus::SuiteLogger::warn(message, ##__VA_ARGS__)
