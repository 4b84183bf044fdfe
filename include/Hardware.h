/**
 * @file Hardware.h
 * @brief Define as constantes e funções relacionadas ao hardware.
 */

#ifndef HARDWARE_H
#define HARDWARE_H

#include <Arduino.h>
#include "Config.h"
#include "Clock.h"
#include "PinPair.h"

namespace Hardware {
    // LED indicador de conectividade
    constexpr uint8_t PIN_LED_INDICATOR = 2;

    // Qualquer horário anterior a 2020-01-01 indica relógio ainda não sincronizado
    constexpr time_t MIN_VALID_EPOCH = 1577836800;

    // Estados de LED
    enum LedState {
        LED_OFF = LOW,
        LED_ON  = HIGH
    };

    /**
     * Configura os pinos auxiliares do sistema (LED).
     *
     * Os pinos do potenciômetro são configurados pelo GpioPinPair,
     * pois mudam de direção a cada ciclo.
     */
    void setupPins();

    /**
     * Define o estado do LED indicador.
     *
     * @param state Estado desejado para o LED (HIGH ou LOW).
     */
    void IRAM_ATTR setLedState(LedState state);

    /**
     * Alterna o estado do LED indicador.
     *
     * Função otimizada para execução rápida.
     */
    void IRAM_ATTR toggleLed();

    /**
     * Par de pinos GPIO do potenciômetro sobre a API digital do Arduino.
     */
    class GpioPinPair : public PinPair {
    private:
        uint8_t m_pinA;
        uint8_t m_pinB;
        bool m_initialized;

        uint8_t toGpio(PinId pin) const { return pin == PIN_A ? m_pinA : m_pinB; }

    public:
        GpioPinPair(uint8_t pinA, uint8_t pinB);

        /**
         * Verifica se os dois pinos existem e aceitam saída, e os deixa
         * em alta impedância.
         *
         * @return false se algum pino for inválido (erro fatal na inicialização).
         */
        bool begin();

        bool setMode(PinId pin, PinMode mode) override;
        bool write(PinId pin, PinLevel level) override;
        bool read(PinId pin, PinLevel &level) override;
    };

    /**
     * Relógio do sistema: millis(), delay() e horário SNTP.
     */
    class SystemClock : public Clock {
    public:
        uint32_t nowMs() override;
        uint32_t epochSeconds() override;
        void delayMs(uint32_t ms) override;
    };

    /**
     * Inicia a sincronização SNTP e aguarda o primeiro horário válido.
     *
     * @param server Servidor NTP.
     * @param timeoutMs Espera máxima.
     * @return true se o relógio foi sincronizado dentro do prazo.
     */
    bool syncTime(const char* server, uint32_t timeoutMs);

} // namespace Hardware

#endif // HARDWARE_H
