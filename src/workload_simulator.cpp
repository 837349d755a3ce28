#include "workload_simulator.hpp"
#include "logger.hpp"
#include <algorithm>
#include <boost/system/error_code.hpp>
#include <vector>

namespace loadplus {

std::chrono::microseconds toTimerDelay(double milliseconds) {
    constexpr auto kMaxDelay = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::duration::max());
    double micros = std::max(0.0, milliseconds) * 1000.0;
    if (!(micros < static_cast<double>(kMaxDelay.count()))) {
        return kMaxDelay;
    }
    return std::chrono::microseconds(static_cast<long long>(micros));
}

SimulatorSettings SimulatorSettings::withOverrides(const SimulatorOverrides& overrides) const {
    SimulatorSettings resolved = *this;
    if (overrides.minLatencyMs) {
        resolved.minLatencyMs = *overrides.minLatencyMs;
    }
    if (overrides.maxLatencyMs) {
        resolved.maxLatencyMs = *overrides.maxLatencyMs;
    }
    if (overrides.failureProbability) {
        resolved.failureProbability = *overrides.failureProbability;
    }
    // A lone override may invert the range, collapse it instead
    if (resolved.maxLatencyMs < resolved.minLatencyMs) {
        if (overrides.maxLatencyMs && !overrides.minLatencyMs) {
            resolved.minLatencyMs = resolved.maxLatencyMs;
        } else {
            resolved.maxLatencyMs = resolved.minLatencyMs;
        }
    }
    return resolved;
}

bool SimulatorSettings::operator==(const SimulatorSettings& other) const {
    return minLatencyMs == other.minLatencyMs && maxLatencyMs == other.maxLatencyMs &&
           failureProbability == other.failureProbability &&
           errorMessage == other.errorMessage;
}

// ===== SimulatorCatalog =====

SimulatorCatalog::SimulatorCatalog() {
    for (auto type : allWorkloadTypes()) {
        settings_[type] = builtInDefaults(type);
    }
}

SimulatorSettings SimulatorCatalog::builtInDefaults(WorkloadType type) {
    switch (type) {
        case WorkloadType::COMPONENT:
            return {20.0, 120.0, 0.02, "Component render exceeded frame budget"};
        case WorkloadType::DATA_PROCESSING:
            return {100.0, 400.0, 0.05, "Data processing batch rejected"};
        case WorkloadType::UI_INTERACTION:
            return {50.0, 150.0, 0.03, "UI interaction handler timed out"};
        case WorkloadType::API_CALL:
            return {200.0, 700.0, 0.08, "API call failed with upstream error"};
        case WorkloadType::ANALYTICS:
            return {300.0, 800.0, 0.05, "Analytics pipeline stage failed"};
        case WorkloadType::ANALYTICS_CONCURRENT:
            return {400.0, 900.0, 0.07, "Concurrent analytics job conflicted"};
        case WorkloadType::RESEARCH_QUESTION:
            return {250.0, 750.0, 0.06, "Research question evaluation failed"};
        case WorkloadType::CONTEXT_PROCESSING:
            return {150.0, 450.0, 0.04, "Context window processing failed"};
        case WorkloadType::GENERIC:
        default:
            return {100.0, 300.0, 0.05, "Simulated operation failed"};
    }
}

const SimulatorSettings& SimulatorCatalog::settingsFor(WorkloadType type) const {
    auto it = settings_.find(type);
    if (it == settings_.end()) {
        it = settings_.find(WorkloadType::GENERIC);
    }
    return it->second;
}

void SimulatorCatalog::setSettings(WorkloadType type, SimulatorSettings settings) {
    settings_[type] = std::move(settings);
}

SimulatorSettings SimulatorCatalog::resolve(WorkloadType type,
                                            const SimulatorOverrides& overrides) const {
    return settingsFor(type).withOverrides(overrides);
}

// ===== WorkloadSimulator =====

WorkloadSimulator::WorkloadSimulator(net::io_context& ioc, WorkloadType type,
                                     SimulatorSettings settings, RandomSource& random)
    : ioc_(ioc), type_(type), settings_(std::move(settings)), random_(random) {
}

double WorkloadSimulator::sampleLatencyMs() {
    return random_.uniform(settings_.minLatencyMs, settings_.maxLatencyMs);
}

SimulationOutcome WorkloadSimulator::drawOutcome() {
    SimulationOutcome outcome;
    if (random_.chance(settings_.failureProbability)) {
        outcome.success = false;
        outcome.error = settings_.errorMessage;
    }
    return outcome;
}

void WorkloadSimulator::completeAfter(std::chrono::microseconds delay,
                                      SimulationOutcome outcome,
                                      CompletionHandler handler) {
    auto timer = std::make_shared<net::steady_timer>(ioc_);
    timer->expires_after(delay);
    timer->async_wait([timer, outcome = std::move(outcome), handler = std::move(handler)](
                          const boost::system::error_code& ec) mutable {
        if (ec == net::error::operation_aborted) {
            outcome.success = false;
            outcome.error = "Simulated operation aborted";
        }
        handler(outcome);
    });
}

// ===== TimedWorkloadSimulator =====

void TimedWorkloadSimulator::simulate(CompletionHandler handler) {
    double latencyMs = sampleLatencyMs();
    completeAfter(toTimerDelay(latencyMs), drawOutcome(), std::move(handler));
}

// ===== BatchProcessingSimulator =====

BatchProcessingSimulator::BatchProcessingSimulator(net::io_context& ioc,
                                                   SimulatorSettings settings,
                                                   RandomSource& random,
                                                   size_t batchSize)
    : WorkloadSimulator(ioc, WorkloadType::DATA_PROCESSING, std::move(settings), random),
      batchSize_(batchSize) {
}

size_t BatchProcessingSimulator::processBatch(size_t batchSize, std::uint32_t seed) {
    struct Record {
        size_t id;
        double value;
        bool processed;
    };

    std::minstd_rand generator(seed);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    std::vector<Record> records;
    records.reserve(batchSize);
    for (size_t i = 0; i < batchSize; ++i) {
        records.push_back({i, dist(generator), false});
    }

    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const Record& r) { return r.value <= 0.5; }),
                  records.end());
    std::sort(records.begin(), records.end(),
              [](const Record& a, const Record& b) { return a.value > b.value; });
    for (auto& record : records) {
        record.processed = true;
    }

    return records.size();
}

void BatchProcessingSimulator::simulate(CompletionHandler handler) {
    double latencyMs = sampleLatencyMs();
    auto outcome = drawOutcome();

    auto started = std::chrono::steady_clock::now();
    auto seed = static_cast<std::uint32_t>(random_.uniform(0.0, 4294967295.0));
    size_t kept = processBatch(batchSize_, seed);
    auto spent = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    SIM_LOG_DEBUG("Processed batch of {} records, {} kept", batchSize_, kept);

    auto remaining = toTimerDelay(latencyMs) - spent;
    completeAfter(std::max(remaining, std::chrono::microseconds(0)), std::move(outcome),
                  std::move(handler));
}

// ===== InteractionSequenceSimulator =====

InteractionSequenceSimulator::InteractionSequenceSimulator(net::io_context& ioc,
                                                           SimulatorSettings settings,
                                                           RandomSource& random,
                                                           int steps)
    : WorkloadSimulator(ioc, WorkloadType::UI_INTERACTION, std::move(settings), random),
      steps_(std::max(1, steps)) {
}

void InteractionSequenceSimulator::simulate(CompletionHandler handler) {
    auto stepDelay = toTimerDelay(sampleLatencyMs() / steps_);
    auto outcome = drawOutcome();
    auto timer = std::make_shared<net::steady_timer>(ioc_);
    auto remaining = std::make_shared<int>(steps_);

    // Each step re-arms the same timer until the sequence is exhausted
    auto step = std::make_shared<std::function<void(const boost::system::error_code&)>>();
    *step = [timer, remaining, stepDelay, outcome, handler = std::move(handler),
             weakStep = std::weak_ptr<std::function<void(const boost::system::error_code&)>>(step)](
                const boost::system::error_code& ec) mutable {
        if (ec == net::error::operation_aborted) {
            handler(SimulationOutcome{false, std::string("Simulated operation aborted")});
            return;
        }
        if (--(*remaining) <= 0) {
            handler(outcome);
            return;
        }
        auto next = weakStep.lock();
        if (!next) {
            return;
        }
        timer->expires_after(stepDelay);
        timer->async_wait([next](const boost::system::error_code& nextEc) { (*next)(nextEc); });
    };

    timer->expires_after(stepDelay);
    timer->async_wait([step](const boost::system::error_code& ec) { (*step)(ec); });
}

// ===== ConcurrentAnalyticsSimulator =====

ConcurrentAnalyticsSimulator::ConcurrentAnalyticsSimulator(net::io_context& ioc,
                                                           SimulatorSettings settings,
                                                           RandomSource& random,
                                                           int fanOut)
    : WorkloadSimulator(ioc, WorkloadType::ANALYTICS_CONCURRENT, std::move(settings), random),
      fanOut_(std::max(1, fanOut)) {
}

void ConcurrentAnalyticsSimulator::simulate(CompletionHandler handler) {
    struct FanOutState {
        int pending;
        SimulationOutcome outcome;
        CompletionHandler handler;
    };

    auto state = std::make_shared<FanOutState>(
        FanOutState{fanOut_, drawOutcome(), std::move(handler)});

    for (int i = 0; i < fanOut_; ++i) {
        auto timer = std::make_shared<net::steady_timer>(ioc_);
        timer->expires_after(toTimerDelay(sampleLatencyMs()));
        timer->async_wait([timer, state](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                state->outcome.success = false;
                state->outcome.error = "Simulated operation aborted";
            }
            if (--state->pending == 0) {
                state->handler(state->outcome);
            }
        });
    }
}

std::unique_ptr<WorkloadSimulator> createSimulator(net::io_context& ioc, WorkloadType type,
                                                   const SimulatorSettings& settings,
                                                   RandomSource& random) {
    switch (type) {
        case WorkloadType::DATA_PROCESSING:
            return std::make_unique<BatchProcessingSimulator>(ioc, settings, random);
        case WorkloadType::UI_INTERACTION:
            return std::make_unique<InteractionSequenceSimulator>(ioc, settings, random);
        case WorkloadType::ANALYTICS_CONCURRENT:
            return std::make_unique<ConcurrentAnalyticsSimulator>(ioc, settings, random);
        default:
            return std::make_unique<TimedWorkloadSimulator>(ioc, type, settings, random);
    }
}

} // namespace loadplus
