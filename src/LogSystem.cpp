/**
 * @file LogSystem.cpp
 * @brief Implementação do logging do firmware.
 */

#include "LogSystem.h"
#include "ConsoleFormat.h"
#include "StringUtils.h"
#include <esp_log.h>
#include <stdarg.h>
#include <string.h>

// ====================================================================
// LogHistory
// ====================================================================

LogHistory* LogHistory::s_instance = nullptr;

LogHistory& LogHistory::getInstance() {
    if (s_instance == nullptr) {
        s_instance = new LogHistory();
    }
    return *s_instance;
}

LogHistory::LogHistory()
    : m_next(0),
      m_stored(0),
      m_lastId(0),
      m_mutex(xSemaphoreCreateMutex()) {
    memset(m_entries, 0, sizeof(m_entries));
}

void LogHistory::append(LogLevel level, const char* module, const char* message, uint32_t timestampMs) {
    if (!m_mutex || xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) != pdTRUE) {
        return;
    }

    LogEntry& entry = m_entries[m_next];
    entry.id = ++m_lastId;
    entry.timestamp = timestampMs;
    entry.level = level;
    StringUtils::safeCopyString(entry.module, module, sizeof(entry.module));
    StringUtils::safeCopyString(entry.message, message, sizeof(entry.message));

    m_next = (m_next + 1) % LOG_BUFFER_SIZE;
    if (m_stored < LOG_BUFFER_SIZE) {
        m_stored++;
    }

    xSemaphoreGive(m_mutex);
}

size_t LogHistory::copySince(uint32_t afterId, LogEntry* out, size_t maxEntries) {
    if (!out || maxEntries == 0) {
        return 0;
    }
    if (!m_mutex || xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) != pdTRUE) {
        return 0;
    }

    // A mais antiga fica em m_next quando o anel está cheio
    size_t oldest = (m_stored < LOG_BUFFER_SIZE) ? 0 : m_next;
    size_t copied = 0;

    for (size_t i = 0; i < m_stored && copied < maxEntries; i++) {
        const LogEntry& entry = m_entries[(oldest + i) % LOG_BUFFER_SIZE];
        if (entry.id > afterId) {
            out[copied++] = entry;
        }
    }

    xSemaphoreGive(m_mutex);
    return copied;
}

uint32_t LogHistory::lastId() {
    uint32_t id = 0;
    if (m_mutex && xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) == pdTRUE) {
        id = m_lastId;
        xSemaphoreGive(m_mutex);
    }
    return id;
}

// ====================================================================
// LogRouter
// ====================================================================

LogRouter* LogRouter::s_instance = nullptr;

LogRouter& LogRouter::getInstance() {
    if (s_instance == nullptr) {
        s_instance = new LogRouter();
    }
    return *s_instance;
}

LogRouter::LogRouter() {
    for (size_t i = 0; i < LOG_LEVEL_COUNT; i++) {
        m_counts[i] = 0;
    }

    // Ruído do watchdog repassado pelo ESP-IDF
    ConsoleManager::getInstance().addFilter("Task watchdog got triggered");
    ConsoleManager::getInstance().addFilter("WATCHDOG-TIMER");

    // Só o WiFi continua falando pelo log nativo, e apenas erros
    esp_log_level_set("*", ESP_LOG_NONE);
    esp_log_level_set("wifi", ESP_LOG_ERROR);
}

void LogRouter::log(LogLevel level, const char* module, const char* fmt, ...) {
    size_t index = static_cast<size_t>(level);
    if (index >= LOG_LEVEL_COUNT || !fmt) {
        return;
    }
    m_counts[index]++;

    bool toSerial = static_cast<int>(level) >= static_cast<int>(LOG_LEVEL_SERIAL);
    bool toHistory = static_cast<int>(level) >= static_cast<int>(LOG_LEVEL_MEMORY);
    if (!toSerial && !toHistory) {
        return;
    }

    const char* source = (module && module[0] != '\0') ? module : "SYS";

    char message[LOG_MAX_MESSAGE_SIZE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    if (toSerial) {
        char line[LOG_MAX_MESSAGE_SIZE + LOG_MODULE_NAME_MAX_SIZE + 16];
        snprintf(line, sizeof(line), "[%s][%s] %s", logLevelName(level), source, message);
        ConsoleManager::getInstance().writeLine(line, level == LogLevel::FATAL);
    }

    if (toHistory) {
        LogHistory::getInstance().append(level, source, message, millis());
    }
}

void LogRouter::status(const char* fmt, ...) {
    if (PRODUCTION_MODE || !fmt) {
        return;
    }

    char line[LOG_MAX_MESSAGE_SIZE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    ConsoleManager::getInstance().status(line);
}

uint32_t LogRouter::getCount(LogLevel level) const {
    size_t index = static_cast<size_t>(level);
    return index < LOG_LEVEL_COUNT ? m_counts[index].load() : 0;
}

// ====================================================================
// Formatação
// ====================================================================

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:   return "TRACE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKN";
    }
}

size_t formatLogEntry(const LogEntry& entry, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return 0;
    }

    int written = snprintf(buffer, size, "[%5u.%03u][%-5s][%-10s] %s",
                           (unsigned)(entry.timestamp / 1000), (unsigned)(entry.timestamp % 1000),
                           logLevelName(entry.level), entry.module, entry.message);

    if (written < 0 || static_cast<size_t>(written) >= size) {
        buffer[0] = '\0';
        return 0;
    }
    return static_cast<size_t>(written);
}
