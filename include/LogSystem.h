/**
 * @file LogSystem.h
 * @brief Logging do firmware: console serial e histórico consultável por HTTP.
 */

#ifndef LOG_SYSTEM_H
#define LOG_SYSTEM_H

#include <Arduino.h>
#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include "Config.h"

#define LOG_LEVEL_COUNT  (static_cast<size_t>(LogLevel::NONE))

/**
 * Entrada do histórico. O id cresce a cada registro e permite que um
 * cliente peça apenas o que ainda não viu.
 */
struct LogEntry {
    uint32_t id;                              ///< Identificador sequencial (1 = primeiro)
    uint32_t timestamp;                       ///< millis() no momento do registro
    LogLevel level;
    char module[LOG_MODULE_NAME_MAX_SIZE];
    char message[LOG_MAX_MESSAGE_SIZE];
};

/**
 * @class LogHistory
 * @brief Histórico circular das últimas LOG_BUFFER_SIZE mensagens.
 *
 * Entradas antigas são sobrescritas; os ids continuam crescendo, então um
 * cliente percebe a perda quando o primeiro id recebido pula.
 */
class LogHistory {
public:
    static LogHistory& getInstance();

    /**
     * @brief Armazena uma mensagem, atribuindo o próximo id.
     */
    void append(LogLevel level, const char* module, const char* message, uint32_t timestampMs);

    /**
     * @brief Copia as entradas com id maior que afterId, da mais antiga à mais recente.
     *
     * @param afterId Último id já conhecido pelo chamador (0 = todas).
     * @param out Vetor de destino.
     * @param maxEntries Capacidade de out.
     * @return Número de entradas copiadas.
     */
    size_t copySince(uint32_t afterId, LogEntry* out, size_t maxEntries);

    /**
     * @return Id da entrada mais recente (0 se vazio).
     */
    uint32_t lastId();

private:
    LogHistory();

    LogHistory(const LogHistory&) = delete;
    LogHistory& operator=(const LogHistory&) = delete;

    LogEntry m_entries[LOG_BUFFER_SIZE];
    size_t m_next;          ///< Posição da próxima escrita
    size_t m_stored;        ///< Entradas válidas (até LOG_BUFFER_SIZE)
    uint32_t m_lastId;
    SemaphoreHandle_t m_mutex;

    static LogHistory* s_instance;
};

/**
 * @class LogRouter
 * @brief Formata mensagens e as distribui entre console e histórico.
 *
 * Os limiares vêm de LOG_LEVEL_SERIAL e LOG_LEVEL_MEMORY (Config.h).
 */
class LogRouter {
public:
    static LogRouter& getInstance();

    /**
     * @brief Registra uma mensagem no formato printf.
     *
     * @param level Nível da mensagem.
     * @param module Módulo de origem (nullptr ou vazio = "SYS").
     * @param fmt String de formato.
     */
    void log(LogLevel level, const char* module, const char* fmt, ...);

    /**
     * @brief Atualiza a linha de status do console. Ignorado em produção.
     */
    void status(const char* fmt, ...);

    /**
     * @return Quantas mensagens do nível foram registradas desde o boot.
     */
    uint32_t getCount(LogLevel level) const;

private:
    LogRouter();

    LogRouter(const LogRouter&) = delete;
    LogRouter& operator=(const LogRouter&) = delete;

    std::atomic<uint32_t> m_counts[LOG_LEVEL_COUNT];

    static LogRouter* s_instance;
};

/**
 * @return Nome curto do nível ("INFO", "WARN", ...).
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Formata uma entrada como "[   12.345][WARN ][Module    ] texto".
 *
 * @return Bytes escritos (sem o terminador), 0 se não coube.
 */
size_t formatLogEntry(const LogEntry& entry, char* buffer, size_t size);

#define LOG_TRACE(module, fmt, ...) LogRouter::getInstance().log(LogLevel::TRACE, module, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(module, fmt, ...) LogRouter::getInstance().log(LogLevel::DEBUG, module, fmt, ##__VA_ARGS__)
#define LOG_INFO(module, fmt, ...)  LogRouter::getInstance().log(LogLevel::INFO, module, fmt, ##__VA_ARGS__)
#define LOG_WARN(module, fmt, ...)  LogRouter::getInstance().log(LogLevel::WARN, module, fmt, ##__VA_ARGS__)
#define LOG_ERROR(module, fmt, ...) LogRouter::getInstance().log(LogLevel::ERROR, module, fmt, ##__VA_ARGS__)
#define LOG_FATAL(module, fmt, ...) LogRouter::getInstance().log(LogLevel::FATAL, module, fmt, ##__VA_ARGS__)

#define LOG_STATUS(fmt, ...) LogRouter::getInstance().status(fmt, ##__VA_ARGS__)

#endif // LOG_SYSTEM_H
