#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "AnalogSampler.h"
#include "FakeHardware.h"

class AnalogSamplerTest : public ::testing::Test {
protected:
    AnalogSamplerTest()
        : pins(&events), clock(0, &events), sampler(pins, clock, config) {
        config.settleMs = 4;
        config.maxCount = 1000;
    }

    std::vector<std::string> events;
    SamplerConfig config;
    FakePinPair pins;
    FakeClock clock;
    AnalogSampler sampler;
};

TEST_F(AnalogSamplerTest, DischargeStrictlyPrecedesCharge) {
    pins.lowReadsBeforeHigh = 3;
    uint32_t count = 0;
    ASSERT_TRUE(sampler.read(count));

    const std::vector<std::string> expected = {
        "mode A in", "mode B out", "write B low", "delay 4",
        "mode B in", "mode A out", "write A high"
    };
    EXPECT_EQ(expected, events);
}

TEST_F(AnalogSamplerTest, ReturnsIterationCount) {
    pins.lowReadsBeforeHigh = 250;
    uint32_t count = 0;
    ASSERT_TRUE(sampler.read(count));
    EXPECT_EQ(250u, count);
    EXPECT_EQ(251u, pins.readCalls);
}

TEST_F(AnalogSamplerTest, ImmediateHighReadsZero) {
    pins.lowReadsBeforeHigh = 0;
    uint32_t count = 99;
    ASSERT_TRUE(sampler.read(count));
    EXPECT_EQ(0u, count);
}

TEST_F(AnalogSamplerTest, CeilingIsAValidReading) {
    pins.neverHigh = true;
    uint32_t count = 0;
    ASSERT_TRUE(sampler.read(count));
    EXPECT_EQ(config.maxCount, count);
    EXPECT_EQ(config.maxCount, pins.readCalls);
}

TEST_F(AnalogSamplerTest, HigherResistanceGivesLargerCount) {
    uint32_t previous = 0;
    for (uint32_t reads = 10; reads <= 900; reads += 110) {
        pins.lowReadsBeforeHigh = reads;
        uint32_t count = 0;
        ASSERT_TRUE(sampler.read(count));
        EXPECT_GT(count, previous);
        previous = count;
    }
}

TEST_F(AnalogSamplerTest, ModeFailurePropagatesWithoutWaiting) {
    pins.failSetMode = true;
    uint32_t count = 0;
    EXPECT_FALSE(sampler.read(count));
    EXPECT_EQ(0u, clock.now);
    EXPECT_EQ(0u, pins.readCalls);
}

TEST_F(AnalogSamplerTest, WriteFailurePropagates) {
    pins.failWrite = true;
    uint32_t count = 0;
    EXPECT_FALSE(sampler.read(count));
    EXPECT_EQ(0u, pins.readCalls);
}

TEST_F(AnalogSamplerTest, ReadFailureMidCountPropagates) {
    pins.neverHigh = true;
    pins.failReadAfter = 20;
    uint32_t count = 0;
    EXPECT_FALSE(sampler.read(count));
    EXPECT_EQ(21u, pins.readCalls);
}

TEST_F(AnalogSamplerTest, EachReadDischargesAgain) {
    pins.lowReadsBeforeHigh = 5;
    uint32_t count = 0;
    ASSERT_TRUE(sampler.read(count));
    ASSERT_TRUE(sampler.read(count));
    EXPECT_EQ(8u, clock.now);
    EXPECT_EQ(5u, count);
}
