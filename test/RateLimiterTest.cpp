#include <gtest/gtest.h>
#include "RateLimiter.h"

namespace {

RateLimiterConfig faderRates() {
    return RateLimiterConfig(0.05f, 0.30f);
}

} // namespace

TEST(RateLimiterTest, RisesAtMostMaxRateUp) {
    RateLimiter limiter(faderRates(), 0);
    EXPECT_NEAR(0.05f, limiter.update(1.0f, 1000), 1e-6f);
}

TEST(RateLimiterTest, FallsAtMostMaxRateDown) {
    RateLimiter limiter(faderRates(), 0, 1.0f);
    EXPECT_NEAR(0.7f, limiter.update(0.0f, 1000), 1e-6f);
}

TEST(RateLimiterTest, ZeroElapsedGivesZeroStep) {
    RateLimiter limiter(faderRates(), 500);
    EXPECT_EQ(0.0f, limiter.update(1.0f, 500));
}

TEST(RateLimiterTest, SnapsWhenWithinEpsilon) {
    RateLimiter limiter(faderRates(), 0, 0.5f);
    EXPECT_EQ(0.5005f, limiter.update(0.5005f, 0));
}

TEST(RateLimiterTest, DoesNotOvershootSmallStep) {
    RateLimiter limiter(faderRates(), 0, 0.5f);
    // Passo permitido (0.05) maior que a distância (0.01)
    EXPECT_FLOAT_EQ(0.51f, limiter.update(0.51f, 1000));
}

TEST(RateLimiterTest, ConvergesWithoutLeavingUnitInterval) {
    RateLimiter limiter(faderRates(), 0);
    uint32_t now = 0;
    float value = 0.0f;

    for (int i = 0; i < 40; i++) {
        now += 1000;
        value = limiter.update(0.8f, now);
        EXPECT_GE(value, 0.0f);
        EXPECT_LE(value, 0.8f + 1e-6f);
    }
    EXPECT_EQ(0.8f, value);

    for (int i = 0; i < 10; i++) {
        now += 1000;
        value = limiter.update(0.0f, now);
        EXPECT_GE(value, 0.0f);
        EXPECT_LE(value, 1.0f);
    }
    EXPECT_EQ(0.0f, value);
}

TEST(RateLimiterTest, IrregularIntervalsAccumulateElapsedTime) {
    RateLimiter limiter(faderRates(), 0);
    limiter.update(1.0f, 100);
    limiter.update(1.0f, 350);
    limiter.update(1.0f, 1200);
    EXPECT_NEAR(0.1f, limiter.update(1.0f, 2000), 1e-5f);
}

TEST(RateLimiterTest, HandlesMillisWraparound) {
    RateLimiter limiter(faderRates(), 0xFFFFFF00u);
    EXPECT_NEAR(0.05f, limiter.update(1.0f, 0x000002E8u), 1e-6f);
}

TEST(RateLimiterTest, ClampsTargetsOutsideUnitInterval) {
    RateLimiter limiter(RateLimiterConfig(10.0f, 10.0f), 0, 0.9f);
    EXPECT_EQ(1.0f, limiter.update(2.0f, 1000));
    EXPECT_EQ(0.0f, limiter.update(-1.0f, 2000));
}

TEST(RateLimiterTest, InitialValueIsClamped) {
    RateLimiter limiter(faderRates(), 0, 1.5f);
    EXPECT_EQ(1.0f, limiter.current());
}

TEST(RateLimiterTest, ResetJumpsWithoutLimiting) {
    RateLimiter limiter(faderRates(), 0);
    limiter.reset(0.6f, 5000);
    EXPECT_EQ(0.6f, limiter.current());
    EXPECT_NEAR(0.65f, limiter.update(1.0f, 6000), 1e-6f);
}
