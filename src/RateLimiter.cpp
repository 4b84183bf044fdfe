/**
 * @file RateLimiter.cpp
 * @brief Implementação do limitador de slew.
 */

#include "RateLimiter.h"
#include <math.h>

namespace {
    inline float clampUnit(float value) {
        if (value < 0.0f) return 0.0f;
        if (value > 1.0f) return 1.0f;
        return value;
    }
} // namespace

constexpr float RateLimiter::SNAP_EPSILON;

RateLimiter::RateLimiter(const RateLimiterConfig &config, uint32_t nowMs, float initial)
    : m_maxRateUp(config.maxRateUp),
    m_maxRateDown(config.maxRateDown),
    m_current(clampUnit(initial)),
    m_lastUpdateMs(nowMs) {
}

float RateLimiter::update(float target, uint32_t nowMs) {
    // Subtração sem sinal: correta mesmo com overflow de millis()
    float elapsed = static_cast<float>(nowMs - m_lastUpdateMs) / 1000.0f;
    m_lastUpdateMs = nowMs;

    float diff = target - m_current;

    if (fabsf(diff) < SNAP_EPSILON) {
        m_current = target;
    } else if (diff > 0.0f) {
        float step = m_maxRateUp * elapsed;
        m_current += (diff < step) ? diff : step;
    } else {
        float step = m_maxRateDown * elapsed;
        m_current -= (-diff < step) ? -diff : step;
    }

    m_current = clampUnit(m_current);
    return m_current;
}

void RateLimiter::reset(float value, uint32_t nowMs) {
    m_current = clampUnit(value);
    m_lastUpdateMs = nowMs;
}
