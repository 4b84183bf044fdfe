#include <gtest/gtest.h>
#include <math.h>
#include <thread>
#include "AnalogSampler.h"
#include "FakeHardware.h"
#include "FaderController.h"
#include "SharedReading.h"

class FaderControllerTest : public ::testing::Test {
protected:
    FaderControllerTest()
        : clock(10000), sampler(pins, clock, config.sampler) {
        config.sampler.settleMs = 4;
        config.sampler.maxCount = 200000;
        config.range = NormalizationRange(0, 100000);
        config.curve = VolumeCurve::LOGARITHMIC;
        config.decibels = DecibelRange(-60.0f, 0.0f);
        config.rateLimiter = RateLimiterConfig(0.05f, 0.30f);
        clock.epoch = 1700000000u;
    }

    FaderConfig config;
    FakePinPair pins;
    FakeClock clock;
    AnalogSampler sampler;
    SharedReading shared;
    FakeSink sink;
};

TEST_F(FaderControllerTest, MidTravelFollowsLogarithmicFormula) {
    config.rateLimiter.enabled = false;
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.lowReadsBeforeHigh = 50000;
    ASSERT_EQ(CycleResult::OK, controller.runCycle());

    float ampMin = powf(10.0f, -60.0f / 20.0f);
    float expected = (powf(10.0f, -30.0f / 20.0f) - ampMin) / (1.0f - ampMin);

    FaderReading reading = shared.snapshot();
    EXPECT_EQ(50000u, reading.rawCount);
    EXPECT_FLOAT_EQ(0.5f, reading.linear);
    EXPECT_NEAR(expected, reading.curved, 1e-6f);
    EXPECT_EQ(reading.curved, reading.output);
    EXPECT_FLOAT_EQ(-30.0f, reading.decibels);
    EXPECT_EQ(1700000000u, reading.timestamp);
    EXPECT_EQ(1u, reading.sequence);

    ASSERT_EQ(1u, sink.values.size());
    EXPECT_EQ(reading.output, sink.values[0]);
}

TEST_F(FaderControllerTest, RateLimiterSlowsTheRise) {
    FaderController controller(config, sampler, clock, shared, &sink);

    // Potenciômetro no máximo desde o boot
    pins.lowReadsBeforeHigh = 100000;
    clock.advance(996);  // + 4 ms de descarga = 1 s desde a construção
    ASSERT_EQ(CycleResult::OK, controller.runCycle());

    FaderReading reading = shared.snapshot();
    EXPECT_NEAR(1.0f, reading.curved, 1e-6f);
    EXPECT_NEAR(0.05f, reading.output, 1e-5f);
}

TEST_F(FaderControllerTest, SampleFailureKeepsPreviousValue) {
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.lowReadsBeforeHigh = 30000;
    ASSERT_EQ(CycleResult::OK, controller.runCycle());
    FaderReading before = shared.snapshot();

    pins.failSetMode = true;
    clock.advance(1000);
    EXPECT_EQ(CycleResult::SAMPLE_FAILED, controller.runCycle());

    FaderReading after = shared.snapshot();
    EXPECT_EQ(before.rawCount, after.rawCount);
    EXPECT_EQ(before.output, after.output);
    EXPECT_EQ(before.sequence, after.sequence);
    EXPECT_EQ(1u, sink.values.size());

    // O laço segue normalmente no ciclo seguinte
    pins.failSetMode = false;
    pins.lowReadsBeforeHigh = 40000;
    clock.advance(1000);
    EXPECT_EQ(CycleResult::OK, controller.runCycle());
    EXPECT_EQ(40000u, shared.snapshot().rawCount);
    EXPECT_EQ(2u, shared.snapshot().sequence);

    CycleStats stats = controller.getStats();
    EXPECT_EQ(3u, stats.cycles);
    EXPECT_EQ(1u, stats.sampleFailures);
    EXPECT_EQ(0u, stats.pushFailures);
}

TEST_F(FaderControllerTest, ReadFailureBeforeFirstCycleLeavesZero) {
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.neverHigh = true;
    pins.failReadAfter = 10;
    EXPECT_EQ(CycleResult::SAMPLE_FAILED, controller.runCycle());

    FaderReading reading = shared.snapshot();
    EXPECT_EQ(0u, reading.rawCount);
    EXPECT_EQ(0u, reading.timestamp);
    EXPECT_TRUE(sink.values.empty());
}

TEST_F(FaderControllerTest, PushFailureStillPublishes) {
    sink.accept = false;
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.lowReadsBeforeHigh = 20000;
    EXPECT_EQ(CycleResult::PUSH_FAILED, controller.runCycle());
    EXPECT_EQ(20000u, shared.snapshot().rawCount);

    sink.accept = true;
    pins.lowReadsBeforeHigh = 25000;
    clock.advance(1000);
    EXPECT_EQ(CycleResult::OK, controller.runCycle());
    EXPECT_EQ(25000u, shared.snapshot().rawCount);

    CycleStats stats = controller.getStats();
    EXPECT_EQ(2u, stats.cycles);
    EXPECT_EQ(1u, stats.pushFailures);
}

TEST_F(FaderControllerTest, RunsWithoutPushSink) {
    FaderController controller(config, sampler, clock, shared, nullptr);
    EXPECT_FALSE(controller.isPushEnabled());

    pins.lowReadsBeforeHigh = 60000;
    EXPECT_EQ(CycleResult::OK, controller.runCycle());
    EXPECT_EQ(60000u, shared.snapshot().rawCount);
}

TEST_F(FaderControllerTest, TimestampIsZeroBeforeClockSync) {
    clock.epoch = 0;
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.lowReadsBeforeHigh = 1000;
    ASSERT_EQ(CycleResult::OK, controller.runCycle());
    EXPECT_EQ(0u, shared.snapshot().timestamp);
    EXPECT_EQ(1000u, shared.snapshot().rawCount);
}

TEST_F(FaderControllerTest, ConditionDoesNotPublish) {
    config.curve = VolumeCurve::EXPONENTIAL;
    config.rateLimiter.enabled = false;
    FaderController controller(config, sampler, clock, shared, &sink);

    FaderReading reading = controller.condition(50000, 12345);
    EXPECT_FLOAT_EQ(0.25f, reading.curved);
    EXPECT_FLOAT_EQ(0.25f, reading.output);
    EXPECT_EQ(12345u, reading.capturedAtMs);

    EXPECT_EQ(0u, shared.snapshot().sequence);
    EXPECT_TRUE(sink.values.empty());
}

TEST_F(FaderControllerTest, DegenerateRangeOutputsSilence) {
    config.range = NormalizationRange(5000, 5000);
    config.rateLimiter.enabled = false;
    FaderController controller(config, sampler, clock, shared, &sink);

    pins.lowReadsBeforeHigh = 80000;
    ASSERT_EQ(CycleResult::OK, controller.runCycle());
    EXPECT_EQ(0.0f, shared.snapshot().output);
    EXPECT_EQ(-60.0f, shared.snapshot().decibels);
}

TEST_F(FaderControllerTest, StatsSnapshotIsConsistentWhileLoopRuns) {
    FaderController controller(config, sampler, clock, shared, &sink);
    pins.lowReadsBeforeHigh = 10;

    // Todo ciclo falha, alternando entre leitura e envio
    const uint32_t totalCycles = 20000;
    std::thread loop([&]() {
        for (uint32_t i = 0; i < totalCycles; i++) {
            bool failSample = (i % 2) == 0;
            pins.failSetMode = failSample;
            sink.accept = false;
            controller.runCycle();
            clock.advance(10);
        }
    });

    uint32_t lastCycles = 0;
    uint32_t inconsistent = 0;
    while (lastCycles < totalCycles) {
        CycleStats stats = controller.getStats();
        if (stats.cycles != stats.sampleFailures + stats.pushFailures ||
            stats.cycles < lastCycles) {
            inconsistent++;
        }
        lastCycles = stats.cycles;
    }
    loop.join();

    EXPECT_EQ(0u, inconsistent);

    CycleStats stats = controller.getStats();
    EXPECT_EQ(totalCycles / 2, stats.sampleFailures);
    EXPECT_EQ(totalCycles / 2, stats.pushFailures);
}
