/**
 * @file FaderController.cpp
 * @brief Implementação do ciclo de amostragem do fader.
 */

#include "FaderController.h"
#include "SignalConditioner.h"

FaderController::FaderController(const FaderConfig &config, AnalogSampler &sampler, Clock &clock,
                                 SharedReading &shared, ValueSink *pushSink)
    : m_config(config),
    m_sampler(sampler),
    m_clock(clock),
    m_shared(shared),
    m_pushSink(pushSink),
    m_limiter(config.rateLimiter, clock.nowMs()),
    m_sequence(0) {
}

FaderReading FaderController::condition(uint32_t raw, uint32_t nowMs) {
    FaderReading reading;

    reading.rawCount = raw;
    reading.capturedAtMs = nowMs;

    reading.linear = SignalConditioner::normalize(raw, m_config.range.min, m_config.range.max);
    reading.curved = SignalConditioner::applyCurve(reading.linear, m_config.curve,
                                                   m_config.decibels.dbMin, m_config.decibels.dbMax);

    if (m_config.rateLimiter.enabled) {
        reading.output = m_limiter.update(reading.curved, nowMs);
    } else {
        reading.output = reading.curved;
    }

    reading.decibels = SignalConditioner::linearToDb(reading.linear,
                                                     m_config.decibels.dbMin, m_config.decibels.dbMax);

    return reading;
}

CycleResult FaderController::finishCycle(CycleResult result) {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.cycles++;
    if (result == CycleResult::SAMPLE_FAILED) {
        m_stats.sampleFailures++;
    } else if (result == CycleResult::PUSH_FAILED) {
        m_stats.pushFailures++;
    }
    return result;
}

CycleResult FaderController::runCycle() {
    uint32_t raw = 0;
    if (!m_sampler.read(raw)) {
        return finishCycle(CycleResult::SAMPLE_FAILED);
    }

    FaderReading reading = condition(raw, m_clock.nowMs());
    reading.timestamp = m_clock.epochSeconds();
    reading.sequence = ++m_sequence;

    m_shared.publish(reading);

    if (m_pushSink != nullptr && !m_pushSink->send(reading.output)) {
        return finishCycle(CycleResult::PUSH_FAILED);
    }

    return finishCycle(CycleResult::OK);
}

CycleStats FaderController::getStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}
