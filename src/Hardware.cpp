/**
 * @file Hardware.cpp
 * @brief Implementa as funções de hardware do sistema.
 */

#include "Hardware.h"
#include "LogSystem.h"
#include <time.h>

// Nome do módulo para logs
#define MODULE_NAME "Hardware"

namespace Hardware {

    void setupPins() {
        LOG_INFO(MODULE_NAME, "Configurando hardware");

        // Configura o pino do LED como saída
        pinMode(PIN_LED_INDICATOR, OUTPUT);

        // Inicializa o LED como desligado
        digitalWrite(PIN_LED_INDICATOR, LED_OFF);

        LOG_INFO(MODULE_NAME, "Pinos configurados");
    }

    void IRAM_ATTR setLedState(LedState state) {
        // Função colocada na IRAM para execução mais rápida
        digitalWrite(PIN_LED_INDICATOR, state);
    }

    void IRAM_ATTR toggleLed() {
        // Alterna o estado do LED (otimizado para IRAM)
        static bool ledState = false;
        ledState = !ledState;
        digitalWrite(PIN_LED_INDICATOR, ledState ? LED_ON : LED_OFF);
    }

    // ==========================================
    // GpioPinPair
    // ==========================================

    GpioPinPair::GpioPinPair(uint8_t pinA, uint8_t pinB)
        : m_pinA(pinA), m_pinB(pinB), m_initialized(false) {
    }

    bool GpioPinPair::begin() {
        if (m_pinA == m_pinB) {
            LOG_ERROR(MODULE_NAME, "Pinos A e B não podem ser iguais (GPIO %u)", m_pinA);
            return false;
        }

        const uint8_t pins[] = { m_pinA, m_pinB };
        for (uint8_t gpio : pins) {
            if (!digitalPinIsValid(gpio)) {
                LOG_ERROR(MODULE_NAME, "GPIO %u inexistente nesta placa", gpio);
                return false;
            }
            if (!digitalPinCanOutput(gpio)) {
                LOG_ERROR(MODULE_NAME, "GPIO %u não suporta saída", gpio);
                return false;
            }
        }

        // Começa com os dois pinos em alta impedância
        pinMode(m_pinA, INPUT);
        pinMode(m_pinB, INPUT);

        m_initialized = true;
        LOG_INFO(MODULE_NAME, "Potenciômetro RC: carga GPIO %u, leitura GPIO %u", m_pinA, m_pinB);
        return true;
    }

    bool GpioPinPair::setMode(PinId pin, PinMode mode) {
        if (!m_initialized) return false;

        pinMode(toGpio(pin), mode == PIN_OUTPUT ? OUTPUT : INPUT);
        return true;
    }

    bool GpioPinPair::write(PinId pin, PinLevel level) {
        if (!m_initialized) return false;

        digitalWrite(toGpio(pin), level == PIN_HIGH ? HIGH : LOW);
        return true;
    }

    bool GpioPinPair::read(PinId pin, PinLevel &level) {
        if (!m_initialized) return false;

        level = digitalRead(toGpio(pin)) == HIGH ? PIN_HIGH : PIN_LOW;
        return true;
    }

    // ==========================================
    // SystemClock
    // ==========================================

    uint32_t SystemClock::nowMs() {
        return millis();
    }

    uint32_t SystemClock::epochSeconds() {
        time_t now = time(nullptr);
        if (now < MIN_VALID_EPOCH) {
            return 0;
        }
        return static_cast<uint32_t>(now);
    }

    void SystemClock::delayMs(uint32_t ms) {
        delay(ms);
    }

    bool syncTime(const char* server, uint32_t timeoutMs) {
        LOG_INFO(MODULE_NAME, "Sincronizando horário com %s", server);
        configTime(0, 0, server);

        uint32_t startTime = millis();
        while (time(nullptr) < MIN_VALID_EPOCH) {
            if (millis() - startTime > timeoutMs) {
                LOG_WARN(MODULE_NAME, "Horário não sincronizado após %lu ms, timestamps serão 0",
                         (unsigned long)timeoutMs);
                return false;
            }
            delay(100);
        }

        LOG_INFO(MODULE_NAME, "Horário sincronizado (epoch %lu)", (unsigned long)time(nullptr));
        return true;
    }
} // namespace Hardware
