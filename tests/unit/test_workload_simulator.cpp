#include <gtest/gtest.h>
#include "test_doubles.hpp"
#include "workload_simulator.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <limits>
#include <optional>

namespace loadplus {

class WorkloadSimulatorTest : public ::testing::Test {
protected:
    void SetUp() override { test::configureQuietLogging(); }

    // Runs one simulate() call to completion, returns outcome and elapsed ms
    std::pair<SimulationOutcome, double> runOnce(WorkloadSimulator& simulator) {
        std::optional<SimulationOutcome> result;
        int completions = 0;
        auto start = std::chrono::steady_clock::now();
        simulator.simulate([&](const SimulationOutcome& outcome) {
            result = outcome;
            ++completions;
        });
        ioc_.run();
        ioc_.restart();
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        EXPECT_EQ(completions, 1);
        return {result.value_or(SimulationOutcome{}), elapsed};
    }

    SimulatorSettings fastSettings(double failureProbability = 0.0) {
        SimulatorSettings settings;
        settings.minLatencyMs = 20;
        settings.maxLatencyMs = 40;
        settings.failureProbability = failureProbability;
        settings.errorMessage = "boom";
        return settings;
    }

    net::io_context ioc_;
};

TEST(SimulatorCatalogTest, BuiltInDefaults) {
    SimulatorCatalog catalog;
    auto api = catalog.settingsFor(WorkloadType::API_CALL);
    EXPECT_DOUBLE_EQ(api.minLatencyMs, 200);
    EXPECT_DOUBLE_EQ(api.maxLatencyMs, 700);
    EXPECT_DOUBLE_EQ(api.failureProbability, 0.08);

    auto component = catalog.settingsFor(WorkloadType::COMPONENT);
    EXPECT_DOUBLE_EQ(component.minLatencyMs, 20);
    EXPECT_DOUBLE_EQ(component.failureProbability, 0.02);

    for (auto type : allWorkloadTypes()) {
        auto settings = catalog.settingsFor(type);
        EXPECT_GE(settings.failureProbability, 0.02);
        EXPECT_LE(settings.failureProbability, 0.08);
        EXPECT_LE(settings.minLatencyMs, settings.maxLatencyMs);
        EXPECT_FALSE(settings.errorMessage.empty());
    }
}

TEST(SimulatorCatalogTest, ReplaceAndResolveWithOverrides) {
    SimulatorCatalog catalog;
    catalog.setSettings(WorkloadType::GENERIC, {1, 2, 0.5, "custom"});
    EXPECT_EQ(catalog.settingsFor(WorkloadType::GENERIC).errorMessage, "custom");

    SimulatorOverrides overrides;
    overrides.failureProbability = 1.0;
    auto resolved = catalog.resolve(WorkloadType::API_CALL, overrides);
    EXPECT_DOUBLE_EQ(resolved.failureProbability, 1.0);
    EXPECT_DOUBLE_EQ(resolved.minLatencyMs, 200);

    // A lone max below the default min collapses the range
    SimulatorOverrides lowMax;
    lowMax.maxLatencyMs = 5;
    resolved = catalog.resolve(WorkloadType::API_CALL, lowMax);
    EXPECT_DOUBLE_EQ(resolved.minLatencyMs, 5);
    EXPECT_DOUBLE_EQ(resolved.maxLatencyMs, 5);
}

TEST(TimerDelayTest, ClampsToSteadyClockRange) {
    using std::chrono::microseconds;
    const auto clockMax = std::chrono::duration_cast<microseconds>(
        std::chrono::steady_clock::duration::max());

    EXPECT_EQ(toTimerDelay(1.5), microseconds(1500));
    EXPECT_EQ(toTimerDelay(-20.0), microseconds(0));
    EXPECT_EQ(toTimerDelay(1e20), clockMax);
    EXPECT_EQ(toTimerDelay(std::numeric_limits<double>::infinity()), clockMax);

    // The clamped delay still converts to the clock's own duration
    auto nanos = std::chrono::duration_cast<std::chrono::steady_clock::duration>(toTimerDelay(1e20));
    EXPECT_GT(nanos.count(), 0);
}

TEST_F(WorkloadSimulatorTest, TimedSimulatorWaitsSampledLatency) {
    test::FixedRandomSource random(1.0);
    TimedWorkloadSimulator simulator(ioc_, WorkloadType::API_CALL, fastSettings(), random);

    auto [outcome, elapsedMs] = runOnce(simulator);
    EXPECT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_GE(elapsedMs, 39.0);
}

TEST_F(WorkloadSimulatorTest, CertainFailureReportsConfiguredMessage) {
    test::FixedRandomSource random;
    TimedWorkloadSimulator simulator(ioc_, WorkloadType::GENERIC, fastSettings(1.0), random);

    auto [outcome, elapsedMs] = runOnce(simulator);
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, "boom");
}

TEST_F(WorkloadSimulatorTest, ZeroProbabilityNeverFails) {
    test::FixedRandomSource random(0.0, 0.0);
    TimedWorkloadSimulator simulator(ioc_, WorkloadType::GENERIC, fastSettings(0.0), random);
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(runOnce(simulator).first.success);
    }
}

TEST_F(WorkloadSimulatorTest, BatchSimulatorCompletesAndFilters) {
    test::FixedRandomSource random;
    BatchProcessingSimulator simulator(ioc_, fastSettings(), random, 200);

    auto [outcome, elapsedMs] = runOnce(simulator);
    EXPECT_TRUE(outcome.success);
    EXPECT_GE(elapsedMs, 29.0);

    size_t kept = BatchProcessingSimulator::processBatch(1000, 42);
    EXPECT_GT(kept, 0u);
    EXPECT_LT(kept, 1000u);
    EXPECT_EQ(kept, BatchProcessingSimulator::processBatch(1000, 42));
}

TEST_F(WorkloadSimulatorTest, InteractionSequenceCompletesOnce) {
    test::FixedRandomSource random(1.0);
    InteractionSequenceSimulator simulator(ioc_, fastSettings(1.0), random, 4);

    auto [outcome, elapsedMs] = runOnce(simulator);
    EXPECT_FALSE(outcome.success);
    EXPECT_GE(elapsedMs, 35.0);
}

TEST_F(WorkloadSimulatorTest, ConcurrentAnalyticsWaitsForAllBranches) {
    test::FixedRandomSource random(0.5);
    ConcurrentAnalyticsSimulator simulator(ioc_, fastSettings(), random, 3);

    auto [outcome, elapsedMs] = runOnce(simulator);
    EXPECT_TRUE(outcome.success);
    EXPECT_GE(elapsedMs, 29.0);
}

TEST_F(WorkloadSimulatorTest, FactoryPicksVariantPerType) {
    test::FixedRandomSource random;
    auto settings = fastSettings();

    auto batch = createSimulator(ioc_, WorkloadType::DATA_PROCESSING, settings, random);
    EXPECT_NE(dynamic_cast<BatchProcessingSimulator*>(batch.get()), nullptr);

    auto ui = createSimulator(ioc_, WorkloadType::UI_INTERACTION, settings, random);
    EXPECT_NE(dynamic_cast<InteractionSequenceSimulator*>(ui.get()), nullptr);

    auto fanOut = createSimulator(ioc_, WorkloadType::ANALYTICS_CONCURRENT, settings, random);
    EXPECT_NE(dynamic_cast<ConcurrentAnalyticsSimulator*>(fanOut.get()), nullptr);

    auto research = createSimulator(ioc_, WorkloadType::RESEARCH_QUESTION, settings, random);
    EXPECT_NE(dynamic_cast<TimedWorkloadSimulator*>(research.get()), nullptr);
    EXPECT_EQ(research->type(), WorkloadType::RESEARCH_QUESTION);
}

TEST(MersenneRandomSourceTest, RespectsBounds) {
    MersenneRandomSource random(7);
    for (int i = 0; i < 1000; ++i) {
        double value = random.uniform(10, 20);
        EXPECT_GE(value, 10);
        EXPECT_LE(value, 20);
    }
    EXPECT_DOUBLE_EQ(random.uniform(5, 5), 5);
    EXPECT_DOUBLE_EQ(random.uniform(5, 1), 5);
    EXPECT_FALSE(random.chance(0.0));
    EXPECT_TRUE(random.chance(1.0));
}

TEST(MersenneRandomSourceTest, SameSeedSameSequence) {
    MersenneRandomSource a(123);
    MersenneRandomSource b(123);
    for (int i = 0; i < 10; ++i) {
        EXPECT_DOUBLE_EQ(a.uniform(0, 1), b.uniform(0, 1));
    }
}

} // namespace loadplus
