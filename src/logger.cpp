#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace loadplus {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    bool wantAsync = config.asyncLogging;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
        config_.asyncLogging = asyncStarted_.load();
    }

    {
        std::lock_guard<std::mutex> fileLock(fileMutex_);
        if (fileStream_.is_open()) {
            fileStream_.close();
        }
        if (config.fileOutput) {
            openLogFile(config.logFile);
        }
    }

    if (wantAsync) {
        startAsyncWorker();
    } else {
        stopAsyncWorker();
    }
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

// Called with fileMutex_ held
void Logger::openLogFile(const std::string& filename) {
    currentLogFile_ = filename;

    std::error_code ec;
    std::filesystem::path logPath(filename);
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    fileStream_.open(currentLogFile_, std::ios::app);
    if (!fileStream_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        std::lock_guard<std::mutex> lock(configMutex_);
        config_.fileOutput = false;
        return;
    }

    currentFileSize_ = std::filesystem::exists(currentLogFile_, ec)
                           ? std::filesystem::file_size(currentLogFile_, ec)
                           : 0;
    if (ec) {
        currentFileSize_ = 0;
    }
}

void Logger::startAsyncWorker() {
    if (asyncStarted_.exchange(true)) {
        return;
    }
    stopAsync_ = false;
    asyncThread_ = std::thread(&Logger::asyncWorker, this);

    std::lock_guard<std::mutex> lock(configMutex_);
    config_.asyncLogging = true;
}

void Logger::stopAsyncWorker() {
    if (!asyncStarted_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_.asyncLogging = false;
    }
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        stopAsync_ = true;
    }
    asyncCondition_.notify_all();
    if (asyncThread_.joinable()) {
        asyncThread_.join();
    }
    asyncStarted_ = false;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    if (!shouldLog(level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    LogFormat format;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        format = config_.format;
    }

    writeLog(format == LogFormat::JSON
                 ? formatJsonMessage(level, component, message, context)
                 : formatTextMessage(level, component, message, context));
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

void Logger::logForRun(LogLevel level, const std::string& component, const std::string& message,
                       const std::string& runId, const LogContext& context) {
    auto runContext = context;
    runContext["run_id"] = runId;
    log(level, component, message, runContext);
}

void Logger::debugForRun(const std::string& component, const std::string& message,
                         const std::string& runId, const LogContext& context) {
    logForRun(LogLevel::DEBUG, component, message, runId, context);
}

void Logger::infoForRun(const std::string& component, const std::string& message,
                        const std::string& runId, const LogContext& context) {
    logForRun(LogLevel::INFO, component, message, runId, context);
}

void Logger::warnForRun(const std::string& component, const std::string& message,
                        const std::string& runId, const LogContext& context) {
    logForRun(LogLevel::WARN, component, message, runId, context);
}

void Logger::errorForRun(const std::string& component, const std::string& message,
                         const std::string& runId, const LogContext& context) {
    logForRun(LogLevel::ERROR, component, message, runId, context);
}

void Logger::logMetric(const std::string& name, double value, const std::string& unit) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (!config_.includeMetrics) return;
    }

    LogContext context = {
        {"metric_name", name},
        {"metric_value", std::to_string(value)},
        {"metric_unit", unit},
        {"metric_type", "gauge"}
    };

    log(LogLevel::INFO, "Metrics", "Metric recorded: " + name, context);
}

void Logger::logPerformance(const std::string& operation, double durationMs,
                            const LogContext& context) {
    auto perfContext = context;
    perfContext["operation"] = operation;
    perfContext["duration_ms"] = std::to_string(durationMs);
    perfContext["performance_log"] = "true";

    log(LogLevel::INFO, "Performance", "Operation completed: " + operation, perfContext);
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::flush() {
    if (asyncStarted_) {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        asyncCondition_.notify_all();
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void Logger::shutdown() {
    stopAsyncWorker();

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

LogLevel Logger::parseLogLevel(const std::string& levelStr) {
    std::string level = levelStr;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN" || level == "WARNING") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    if (level == "FATAL") return LogLevel::FATAL;

    return LogLevel::INFO;
}

LogFormat Logger::parseLogFormat(const std::string& formatStr) {
    std::string format = formatStr;
    std::transform(format.begin(), format.end(), format.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return format == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

std::string Logger::formatTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::formatTextMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::ostringstream oss;
    oss << "[" << formatTimestamp() << "] "
        << "[" << levelToString(level) << "] "
        << "[" << component << "] "
        << message;

    if (!context.empty()) {
        oss << " |";
        for (const auto& [key, value] : context) {
            oss << " " << key << "=" << value;
        }
    }

    return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level, const std::string& component,
                                      const std::string& message,
                                      const LogContext& context) const {
    std::string levelName = levelToString(level);
    levelName.erase(levelName.find_last_not_of(' ') + 1);

    nlohmann::json entry = {
        {"timestamp", formatTimestamp()},
        {"level", levelName},
        {"component", component},
        {"message", message}
    };
    if (!context.empty()) {
        entry["context"] = context;
    }
    // Replace invalid UTF-8 rather than throwing from inside the logger
    return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::writeLog(const std::string& formattedMessage) {
    if (asyncStarted_) {
        writeLogAsync(formattedMessage);
    } else {
        writeLogSync(formattedMessage);
    }
}

void Logger::writeLogSync(const std::string& formattedMessage) {
    bool console;
    bool file;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        console = config_.consoleOutput;
        file = config_.fileOutput;
    }

    if (console) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        std::cout << formattedMessage << std::endl;
    }

    if (file) {
        std::lock_guard<std::mutex> lock(fileMutex_);
        if (fileStream_.is_open()) {
            rotateLogFile();
            fileStream_ << formattedMessage << std::endl;
            currentFileSize_ += formattedMessage.length() + 1;
        }
    }
}

void Logger::writeLogAsync(const std::string& formattedMessage) {
    size_t maxQueueSize;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        maxQueueSize = config_.maxQueueSize;
    }

    std::lock_guard<std::mutex> lock(asyncMutex_);
    if (messageQueue_.size() >= maxQueueSize) {
        metrics_.droppedMessages++;
        return;
    }

    messageQueue_.push(formattedMessage);
    asyncCondition_.notify_one();
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    while (true) {
        asyncCondition_.wait(lock, [this] {
            return !messageQueue_.empty() || stopAsync_;
        });

        while (!messageQueue_.empty()) {
            std::string message = std::move(messageQueue_.front());
            messageQueue_.pop();
            lock.unlock();

            writeLogSync(message);

            lock.lock();
        }

        if (stopAsync_) {
            break;
        }
    }
}

// Called with fileMutex_ held
void Logger::rotateLogFile() {
    bool enabled;
    size_t maxFileSize;
    int maxBackupFiles;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        enabled = config_.enableRotation;
        maxFileSize = config_.maxFileSize;
        maxBackupFiles = config_.maxBackupFiles;
    }
    if (!enabled || currentFileSize_ < maxFileSize) return;

    fileStream_.close();

    std::error_code ec;
    for (int i = maxBackupFiles - 1; i > 0; i--) {
        std::string oldFile = currentLogFile_ + "." + std::to_string(i);
        std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

        if (std::filesystem::exists(oldFile, ec)) {
            if (i == maxBackupFiles - 1) {
                std::filesystem::remove(newFile, ec); // Remove oldest
            }
            std::filesystem::rename(oldFile, newFile, ec);
        }
    }

    if (maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
        std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
    }

    fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
    currentFileSize_ = 0;

    if (!fileStream_.is_open()) {
        std::cerr << "Failed to create new log file after rotation: " << currentLogFile_ << std::endl;
        std::lock_guard<std::mutex> lock(configMutex_);
        config_.fileOutput = false;
    }
}

bool Logger::shouldLog(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
        return false;
    }

    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }

    return true;
}

} // namespace loadplus
