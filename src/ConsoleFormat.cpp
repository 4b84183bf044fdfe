/**
 * @file ConsoleFormat.cpp
 * @brief Implementação da saída serial sincronizada.
 */

#include "ConsoleFormat.h"
#include <string.h>

#define CONSOLE_DIVIDER "----------------------------------------"

ConsoleManager* ConsoleManager::s_instance = nullptr;

ConsoleManager& ConsoleManager::getInstance() {
    if (s_instance == nullptr) {
        s_instance = new ConsoleManager();
    }
    return *s_instance;
}

ConsoleManager::ConsoleManager()
    : m_mutex(xSemaphoreCreateMutex()),
      m_filterCount(0),
      m_statusLength(0) {
    for (size_t i = 0; i < CONSOLE_MAX_FILTERS; i++) {
        m_filters[i] = nullptr;
    }
}

bool ConsoleManager::lock(uint32_t timeoutMs) {
    return m_mutex && xSemaphoreTake(m_mutex, pdMS_TO_TICKS(timeoutMs)) == pdTRUE;
}

void ConsoleManager::unlock() {
    xSemaphoreGive(m_mutex);
}

bool ConsoleManager::addFilter(const char* pattern) {
    if (!pattern || pattern[0] == '\0') {
        return false;
    }
    if (!lock(100)) {
        return false;
    }

    bool added = false;
    bool duplicate = false;
    for (size_t i = 0; i < m_filterCount; i++) {
        if (strcmp(m_filters[i], pattern) == 0) {
            duplicate = true;
            break;
        }
    }

    if (duplicate) {
        added = true;
    } else if (m_filterCount < CONSOLE_MAX_FILTERS) {
        m_filters[m_filterCount++] = pattern;
        added = true;
    }

    unlock();
    return added;
}

bool ConsoleManager::isFiltered(const char* text) const {
    for (size_t i = 0; i < m_filterCount; i++) {
        if (strstr(text, m_filters[i]) != nullptr) {
            return true;
        }
    }
    return false;
}

void ConsoleManager::breakStatusLine() {
    if (m_statusLength > 0) {
        Serial.println();
        m_statusLength = 0;
    }
}

void ConsoleManager::writeLine(const char* text, bool critical) {
    if (!text) {
        return;
    }
    // Mensagens críticas esperam mais pelo console
    if (!lock(critical ? 1000 : 200)) {
        return;
    }

    if (critical || !isFiltered(text)) {
        breakStatusLine();
        Serial.println(text);
    }

    unlock();
}

void ConsoleManager::status(const char* text) {
    if (!text || !lock(50)) {
        return;
    }

    size_t len = strlen(text);
    Serial.print('\r');
    Serial.print(text);

    // Cobre o final de uma linha anterior mais longa
    for (size_t i = len; i < m_statusLength; i++) {
        Serial.print(' ');
    }

    // Uma linha vazia ainda conta como ativa para a próxima quebra
    m_statusLength = len > 0 ? len : 1;

    unlock();
}

void ConsoleManager::banner(const char* title) {
    if (!lock(200)) {
        return;
    }

    breakStatusLine();
    Serial.println();
    Serial.println(CONSOLE_DIVIDER);
    Serial.println(title ? title : "");
    Serial.println(CONSOLE_DIVIDER);

    unlock();
}

void ConsoleManager::closeBanner() {
    if (!lock(200)) {
        return;
    }

    breakStatusLine();
    Serial.println(CONSOLE_DIVIDER);

    unlock();
}

void ConsoleManager::reset() {
    if (!lock(300)) {
        return;
    }

    Serial.flush();
    Serial.println();
    Serial.println();
    m_statusLength = 0;

    unlock();
}
