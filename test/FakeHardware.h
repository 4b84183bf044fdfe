/**
 * @file FakeHardware.h
 * @brief Dublês de PinPair, Clock e ValueSink para os testes no host.
 */

#ifndef FAKE_HARDWARE_H
#define FAKE_HARDWARE_H

#include <stdint.h>
#include <string>
#include <vector>
#include "Clock.h"
#include "PinPair.h"
#include "ValueSink.h"

/**
 * Simula a rede RC: o pino B lê nível baixo por lowReadsBeforeHigh
 * leituras após o início da carga e depois nível alto.
 */
class FakePinPair : public PinPair {
public:
    explicit FakePinPair(std::vector<std::string> *events = nullptr)
        : lowReadsBeforeHigh(0), neverHigh(false),
          failSetMode(false), failWrite(false), failReadAfter(-1),
          readCalls(0), m_events(events), m_chargeReads(0) {}

    uint32_t lowReadsBeforeHigh;
    bool neverHigh;          // Circuito aberto: B nunca sobe
    bool failSetMode;
    bool failWrite;
    int failReadAfter;       // Falha a partir da N-ésima leitura do ciclo (-1 = nunca)
    uint32_t readCalls;

    bool setMode(PinId pin, PinMode mode) override {
        record(std::string("mode ") + name(pin) + (mode == PIN_OUTPUT ? " out" : " in"));
        if (failSetMode) return false;

        // B em entrada marca o início da fase de carga
        if (pin == PIN_B && mode == PIN_INPUT) {
            m_chargeReads = 0;
        }
        return true;
    }

    bool write(PinId pin, PinLevel level) override {
        record(std::string("write ") + name(pin) + (level == PIN_HIGH ? " high" : " low"));
        return !failWrite;
    }

    bool read(PinId pin, PinLevel &level) override {
        readCalls++;
        if (failReadAfter >= 0 && m_chargeReads >= static_cast<uint32_t>(failReadAfter)) {
            return false;
        }

        if (pin == PIN_B) {
            level = (neverHigh || m_chargeReads < lowReadsBeforeHigh) ? PIN_LOW : PIN_HIGH;
            m_chargeReads++;
        } else {
            level = PIN_LOW;
        }
        return true;
    }

private:
    std::vector<std::string> *m_events;
    uint32_t m_chargeReads;

    static const char *name(PinId pin) { return pin == PIN_A ? "A" : "B"; }

    void record(const std::string &event) {
        if (m_events) m_events->push_back(event);
    }
};

/**
 * Relógio manual: delayMs() apenas avança o tempo.
 */
class FakeClock : public Clock {
public:
    explicit FakeClock(uint32_t startMs = 0, std::vector<std::string> *events = nullptr)
        : now(startMs), epoch(0), m_events(events) {}

    uint32_t now;
    uint32_t epoch;

    uint32_t nowMs() override { return now; }
    uint32_t epochSeconds() override { return epoch; }

    void delayMs(uint32_t ms) override {
        if (m_events) m_events->push_back("delay " + std::to_string(ms));
        now += ms;
    }

    void advance(uint32_t ms) { now += ms; }

private:
    std::vector<std::string> *m_events;
};

/**
 * Destino de envio que registra os valores recebidos.
 */
class FakeSink : public ValueSink {
public:
    FakeSink() : accept(true) {}

    bool accept;
    std::vector<float> values;

    bool send(float value) override {
        values.push_back(value);
        return accept;
    }
};

#endif // FAKE_HARDWARE_H
