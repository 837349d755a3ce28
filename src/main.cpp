#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config_manager.hpp"
#include "load_exceptions.hpp"
#include "load_test_engine.hpp"
#include "load_test_suite.hpp"
#include "logger.hpp"
#include "stop_signal_handler.hpp"

namespace net = boost::asio;
namespace po = boost::program_options;

using namespace loadplus;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

// Whatever should happen when SIGINT/SIGTERM arrives for the current work
class StopHook {
public:
  void set(std::function<void()> action) {
    std::lock_guard<std::mutex> lock(mutex_);
    action_ = std::move(action);
  }

  void reset() { set(nullptr); }

  // Clears the action when the guarded work goes out of scope
  class Scope {
  public:
    Scope(StopHook &hook, std::function<void()> action) : hook_(hook) {
      hook_.set(std::move(action));
    }
    ~Scope() { hook_.reset(); }

  private:
    StopHook &hook_;
  };

  void fire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (action_) {
      action_();
    }
  }

private:
  std::mutex mutex_;
  std::function<void()> action_;
};

std::optional<std::string> resolveConfigPath(const po::variables_map &vm) {
  if (vm.count("config")) {
    return vm["config"].as<std::string>();
  }
  if (const char *envPath = std::getenv("LOADPLUS_CONFIG")) {
    return std::string(envPath);
  }
  if (std::ifstream("config.json").good()) {
    return std::string("config.json");
  }
  return std::nullopt;
}

void configureLogging(const ConfigManager &config) {
  Logger::getInstance().configure(config.getLoggingConfig());
  if (const char *levelEnv = std::getenv("LOADPLUS_LOG_LEVEL")) {
    Logger::getInstance().setLogLevel(Logger::parseLogLevel(levelEnv));
  }
}

std::vector<LoadTestReport> runSuite(LoadTestEngine &engine, const std::string &name,
                                     const std::optional<std::string> &typeFilter,
                                     StopHook &stopHook) {
  LoadTestSuite base = LoadTestSuite::byName(name);

  auto execute = [&stopHook, &engine](LoadTestSuite &suite) {
    auto stats = suite.getStatistics();
    std::cout << "Suite '" << suite.name() << "': " << stats.totalTests
              << " tests, estimated " << stats.estimatedDurationSeconds << "s\n";
    SuiteResult result;
    {
      StopHook::Scope stopScope(stopHook, [&suite]() { suite.stop(); });
      result = suite.run(engine);
    }
    std::cout << "Suite status: " << testStatusToString(result.overallStatus)
              << (result.stoppedEarly ? " (stopped early)" : "") << "\n";
    return result.reports;
  };

  if (typeFilter) {
    LoadTestSuite filtered = base.filterByType(parseWorkloadType(*typeFilter));
    return execute(filtered);
  }
  return execute(base);
}

} // namespace

int main(int argc, char *argv[]) {
  po::options_description options("LoadPlus load test runner");
  options.add_options()
      ("help,h", "Show this help message")
      ("config,c", po::value<std::string>(), "JSON configuration file")
      ("concurrency,u", po::value<int>()->default_value(5), "Number of virtual users")
      ("duration,d", po::value<double>()->default_value(10.0), "Test duration in seconds")
      ("ramp-up,r", po::value<double>()->default_value(0.0), "Ramp-up time in seconds")
      ("type,t", po::value<std::string>(), "Workload type (suite filter when --suite is set)")
      ("suite,s", po::value<std::string>(), "Run a predefined suite: quick | comprehensive")
      ("min-latency", po::value<double>(), "Override minimum simulated latency (ms)")
      ("max-latency", po::value<double>(), "Override maximum simulated latency (ms)")
      ("failure-probability", po::value<double>(), "Override simulated failure probability")
      ("output,o", po::value<std::string>(), "Write the reports as a JSON array to this file");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "Error: " << e.what() << "\n\n" << options << std::endl;
    return kExitUsage;
  }

  if (vm.count("help")) {
    std::cout << options << std::endl;
    return kExitOk;
  }

  auto &config = ConfigManager::getInstance();
  if (auto configPath = resolveConfigPath(vm)) {
    if (!config.loadConfig(*configPath)) {
      std::cerr << "Failed to load configuration from " << *configPath << std::endl;
      return kExitUsage;
    }
  }
  configureLogging(config);

  auto validation = config.validateConfiguration();
  for (const auto &warning : validation.warnings) {
    LOG_WARN("Main", "Configuration warning: " + warning);
  }
  if (!validation.isValid) {
    for (const auto &error : validation.errors) {
      LOG_ERROR("Main", "Configuration error: " + error);
      std::cerr << "Configuration error: " << error << std::endl;
    }
    return kExitUsage;
  }

  StopHook stopHook;
  net::io_context signalContext;
  StopSignalHandler signalHandler(
      signalContext, {SIGINT, SIGTERM},
      [&stopHook](int) { stopHook.fire(); },
      [](int signalNumber) {
        LOG_ERROR("Main", "Load test did not stop in time, exiting");
        Logger::getInstance().flush();
        std::_Exit(128 + signalNumber);
      });
  std::thread signalThread([&signalContext]() { signalContext.run(); });

  auto shutdownSignals = [&]() {
    signalHandler.cancel();
    signalContext.stop();
    if (signalThread.joinable()) {
      signalThread.join();
    }
  };

  int exitCode = kExitOk;
  try {
    LoadTestEngine engine(config.getEngineConfig());
    std::vector<LoadTestReport> reports;

    if (vm.count("suite")) {
      std::optional<std::string> typeFilter;
      if (vm.count("type")) {
        typeFilter = vm["type"].as<std::string>();
      }
      reports = runSuite(engine, vm["suite"].as<std::string>(), typeFilter, stopHook);
    } else {
      std::string type = vm.count("type") ? vm["type"].as<std::string>() : "generic";
      auto profile = WorkloadProfile::create(vm["concurrency"].as<int>(),
                                             vm["duration"].as<double>(),
                                             vm["ramp-up"].as<double>(), type);
      if (vm.count("min-latency")) {
        profile.overrides.minLatencyMs = vm["min-latency"].as<double>();
      }
      if (vm.count("max-latency")) {
        profile.overrides.maxLatencyMs = vm["max-latency"].as<double>();
      }
      if (vm.count("failure-probability")) {
        profile.overrides.failureProbability = vm["failure-probability"].as<double>();
      }

      StopHook::Scope stopScope(stopHook, [&engine]() { engine.stopAll(); });
      reports.push_back(engine.runLoadTest(profile));
    }

    TestStatus worst = TestStatus::PASS;
    for (const auto &report : reports) {
      std::cout << report.summarize() << std::endl;
      worst = worstStatus(worst, report.status);
    }

    if (vm.count("output")) {
      const auto outputPath = vm["output"].as<std::string>();
      writeReportsFile(outputPath, reports);
      LOG_INFO("Main", "Wrote " + std::to_string(reports.size()) + " report(s) to " +
                           outputPath);
    }

    exitCode = worst == TestStatus::FAIL ? kExitFailed : kExitOk;
  } catch (const ConfigurationException &e) {
    LOG_ERROR("Main", e.toLogString());
    std::cerr << "Invalid configuration: " << e.getMessage() << std::endl;
    exitCode = kExitUsage;
  } catch (const LoadTestException &e) {
    LOG_ERROR("Main", e.toLogString());
    std::cerr << "Load test error: " << e.getMessage();
    auto details = e.getContext().find("details");
    if (details != e.getContext().end()) {
      std::cerr << " (" << details->second << ")";
    }
    std::cerr << (isRetryableError(e.getCode()) ? ", retryable" : "") << std::endl;
    exitCode = kExitFailed;
  } catch (const std::exception &e) {
    LOG_FATAL("Main", "Unhandled exception: " + std::string(e.what()));
    std::cerr << "Fatal error: " << e.what() << std::endl;
    exitCode = kExitFailed;
  }

  shutdownSignals();
  Logger::getInstance().flush();
  return exitCode;
}
