#include "system_metrics.hpp"
#include "logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

#ifdef __APPLE__
#include <mach/mach.h>
#include <mach/task.h>
#elif __linux__
#include <unistd.h>
#endif

namespace loadplus {

namespace {
constexpr double kBytesPerMB = 1024.0 * 1024.0;
}

ResourceSnapshot SystemMetrics::sample() {
    ResourceSnapshot snapshot;
    snapshot.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    snapshot.heapUsedMB = static_cast<double>(getProcessMemoryUsage()) / kBytesPerMB;
    snapshot.cpuPercent = getProcessCpuUsage();
    return snapshot;
}

double SystemMetrics::getProcessCpuUsage() {
    double cpuSeconds = readProcessCpuSeconds();
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(cpuMutex_);
    double usage = 0.0;
    if (hasCpuReading_) {
        double elapsed = std::chrono::duration<double>(now - lastCpuTime_).count();
        if (elapsed > 0.0) {
            usage = std::clamp((cpuSeconds - lastCpuSeconds_) / elapsed * 100.0, 0.0, 100.0);
        }
    }
    lastCpuSeconds_ = cpuSeconds;
    lastCpuTime_ = now;
    hasCpuReading_ = true;
    return usage;
}

// Platform-specific implementations

#ifdef __APPLE__

size_t SystemMetrics::getProcessMemoryUsage() const {
    mach_task_basic_info_data_t info;
    mach_msg_type_number_t count = MACH_TASK_BASIC_INFO_COUNT;

    kern_return_t kr = task_info(mach_task_self(), MACH_TASK_BASIC_INFO,
                                 reinterpret_cast<task_info_t>(&info), &count);
    if (kr != KERN_SUCCESS) {
        METRICS_LOG_WARN("task_info failed, reporting zero resident memory");
        return 0;
    }
    return info.resident_size;
}

double SystemMetrics::readProcessCpuSeconds() const {
    task_thread_times_info_data_t info;
    mach_msg_type_number_t count = TASK_THREAD_TIMES_INFO_COUNT;

    kern_return_t kr = task_info(mach_task_self(), TASK_THREAD_TIMES_INFO,
                                 reinterpret_cast<task_info_t>(&info), &count);
    if (kr != KERN_SUCCESS) {
        return 0.0;
    }
    return info.user_time.seconds + info.user_time.microseconds / 1000000.0 +
           info.system_time.seconds + info.system_time.microseconds / 1000000.0;
}

#elif __linux__

size_t SystemMetrics::getProcessMemoryUsage() const {
    std::ifstream status("/proc/self/status");
    if (!status.is_open()) {
        METRICS_LOG_WARN("Cannot open /proc/self/status, reporting zero resident memory");
        return 0;
    }

    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line);
            std::string key, unit;
            size_t value = 0;

            if (iss >> key >> value >> unit) {
                return value * 1024; // kB to bytes
            }
        }
    }

    return 0;
}

double SystemMetrics::readProcessCpuSeconds() const {
    std::ifstream stat("/proc/self/stat");
    if (!stat.is_open()) {
        return 0.0;
    }

    std::string line;
    std::getline(stat, line);

    // The command name may contain spaces, fields resume after the last ')'
    auto closing = line.rfind(')');
    if (closing == std::string::npos) {
        return 0.0;
    }
    std::istringstream iss(line.substr(closing + 2));
    std::string token;

    // utime and stime are fields 14 and 15, i.e. 12th and 13th after ')'
    for (int i = 0; i < 11; ++i) {
        iss >> token;
    }

    long utime = 0, stime = 0;
    if (!(iss >> utime >> stime)) {
        return 0.0;
    }

    long ticksPerSecond = sysconf(_SC_CLK_TCK);
    if (ticksPerSecond <= 0) {
        return 0.0;
    }
    return static_cast<double>(utime + stime) / static_cast<double>(ticksPerSecond);
}

#else

size_t SystemMetrics::getProcessMemoryUsage() const {
    // Unsupported platform
    return 0;
}

double SystemMetrics::readProcessCpuSeconds() const {
    return 0.0;
}

#endif

} // namespace loadplus
