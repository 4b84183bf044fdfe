/**
 * @file FaderTelemetry.h
 * @brief Fotografia do estado do fader e do sistema, serializável para JSON e console.
 */

#ifndef FADER_TELEMETRY_H
#define FADER_TELEMETRY_H

#include <Arduino.h>
#include <ArduinoJson.h>
#include "Config.h"
#include "DataTypes.h"
#include "FaderController.h"
#include "OscSender.h"
#include "SharedReading.h"

/**
 * @struct FaderTelemetry
 * @brief Agrupa leitura, contadores e estado do sistema em um instante.
 *
 * Montada pela tarefa de serviços (linha de status) e pelos handlers HTTP
 * a partir de SharedReading::snapshot(); nunca dispara uma amostragem.
 */
struct FaderTelemetry {
    FaderReading reading;    ///< Última leitura publicada
    CycleStats cycles;       ///< Contadores do laço de amostragem
    SystemStats system;      ///< Heap e uptime
    bool pushEnabled;        ///< Envio OSC ativo
    uint32_t oscSent;        ///< Datagramas OSC enviados
    int16_t wifiRssi;        ///< Força do sinal WiFi em dBm
    char ipAddress[16];      ///< Endereço IP em formato string
    uint32_t logWarnings;    ///< Avisos registrados desde o boot
    uint32_t logErrors;      ///< Erros e falhas fatais registrados desde o boot

    FaderTelemetry();

    /**
     * @brief Coleta o estado atual de todas as fontes.
     *
     * @param shared Célula com a última leitura
     * @param controller Controlador (contadores)
     * @param oscSender Sender OSC ou nullptr se desabilitado
     * @return Fotografia preenchida
     */
    static FaderTelemetry capture(const SharedReading& shared, const FaderController& controller,
                                  const OscSender* oscSender);

    /**
     * @brief Serializa a leitura, os contadores e o sistema para JSON.
     *
     * @param json Objeto JSON de destino
     * @param nowMs Instante atual (para a idade da leitura)
     */
    void toJson(JsonObject& json, uint32_t nowMs) const;

    /**
     * @brief Formata a linha de status do console.
     *
     * @param buffer Buffer de destino
     * @param bufferSize Tamanho do buffer
     * @return Ponteiro para o buffer preenchido
     */
    char* toConsoleString(char* buffer, size_t bufferSize) const;
};

#endif // FADER_TELEMETRY_H
