/**
 * @file AnalogSampler.cpp
 * @brief Implementação do amostrador por tempo de carga RC.
 */

#include "AnalogSampler.h"

AnalogSampler::AnalogSampler(PinPair &pins, Clock &clock, const SamplerConfig &config)
    : m_pins(pins),
    m_clock(clock),
    m_config(config) {
}

bool AnalogSampler::discharge() {
    if (!m_pins.setMode(PinPair::PIN_A, PinPair::PIN_INPUT)) {
        return false;
    }

    if (!m_pins.setMode(PinPair::PIN_B, PinPair::PIN_OUTPUT) ||
        !m_pins.write(PinPair::PIN_B, PinPair::PIN_LOW)) {
        return false;
    }

    // Tempo para o capacitor descarregar completamente por B
    m_clock.delayMs(m_config.settleMs);
    return true;
}

bool AnalogSampler::chargeTime(uint32_t &count) {
    if (!m_pins.setMode(PinPair::PIN_B, PinPair::PIN_INPUT)) {
        return false;
    }

    if (!m_pins.setMode(PinPair::PIN_A, PinPair::PIN_OUTPUT) ||
        !m_pins.write(PinPair::PIN_A, PinPair::PIN_HIGH)) {
        return false;
    }

    count = 0;
    PinPair::PinLevel level = PinPair::PIN_LOW;

    // Polling limitado pelo teto: um divisor desconectado nunca trava o ciclo
    while (count < m_config.maxCount) {
        if (!m_pins.read(PinPair::PIN_B, level)) {
            return false;
        }
        if (level == PinPair::PIN_HIGH) {
            break;
        }
        count++;
    }

    return true;
}

bool AnalogSampler::read(uint32_t &count) {
    // A descarga precisa terminar antes de iniciar a medição da subida
    if (!discharge()) {
        return false;
    }

    return chargeTime(count);
}
