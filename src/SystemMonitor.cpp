/**
 * @file SystemMonitor.cpp
 * @brief Implementação do monitor de sistema.
 */

#include "SystemMonitor.h"
#include "LogSystem.h"
#include <esp_heap_caps.h>

#define MODULE_NAME "SysMonitor"

SystemMonitor *SystemMonitor::s_instance = nullptr;

SystemMonitor &SystemMonitor::getInstance() {
    if (s_instance == nullptr) {
        s_instance = new SystemMonitor();
    }
    return *s_instance;
}

SystemMonitor::SystemMonitor()
    : m_mutex(nullptr),
      m_watchdogActive(false),
      m_taskCount(0),
      m_lastRefreshMs(0),
      m_lastIntegrityMs(0),
      m_lowHeapReported(false),
      m_lowStackReported(false) {
    for (size_t i = 0; i < MONITOR_MAX_TRACKED_TASKS; i++) {
        m_tasks[i] = nullptr;
    }
}

bool SystemMonitor::init() {
    m_mutex = xSemaphoreCreateMutex();
    if (!m_mutex) {
        LOG_ERROR(MODULE_NAME, "Falha ao criar mutex de estatísticas");
        return false;
    }

    if (ENABLE_TASK_WATCHDOG) {
        m_watchdogActive = setupWatchdog();
    } else {
        LOG_INFO(MODULE_NAME, "Watchdog desativado por configuração");
    }

    refreshStats();
    LOG_INFO(MODULE_NAME, "Heap livre inicial: %u bytes", (unsigned)m_stats.freeHeap);
    return true;
}

bool SystemMonitor::setupWatchdog() {
    // Sem panic: um laço travado gera o aviso do TWDT e o reset vem dele
    esp_err_t err = esp_task_wdt_init(WATCHDOG_TIMEOUT / 1000, false);
    if (err != ESP_OK) {
        LOG_ERROR(MODULE_NAME, "Erro ao inicializar TWDT: %d", err);
        return false;
    }

    LOG_INFO(MODULE_NAME, "Watchdog ativo, timeout de %u ms", WATCHDOG_TIMEOUT);
    return true;
}

bool SystemMonitor::watchCurrentTask() {
    TaskHandle_t self = xTaskGetCurrentTaskHandle();

    if (m_mutex && xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) == pdTRUE) {
        if (m_taskCount < MONITOR_MAX_TRACKED_TASKS) {
            m_tasks[m_taskCount++] = self;
        }
        xSemaphoreGive(m_mutex);
    }

    if (!m_watchdogActive) {
        return true;
    }

    esp_err_t err = esp_task_wdt_add(self);
    if (err != ESP_OK) {
        LOG_ERROR(MODULE_NAME, "Tarefa '%s' fora do watchdog: %d", pcTaskGetTaskName(self), err);
        return false;
    }
    return true;
}

void SystemMonitor::feed() {
    if (m_watchdogActive) {
        esp_task_wdt_reset();
    }
}

void SystemMonitor::refreshStats() {
    SystemStats stats;

    stats.freeHeap = esp_get_free_heap_size();
    stats.minFreeHeap = esp_get_minimum_free_heap_size();
    stats.uptime = millis() / 1000;

    // Fragmentação: quanto do heap livre não está no maior bloco
    uint32_t largestBlock = heap_caps_get_largest_free_block(MALLOC_CAP_8BIT);
    if (stats.freeHeap > 0) {
        stats.heapFragmentation = 100 - (largestBlock * 100 / stats.freeHeap);
    }

    if (xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) != pdTRUE) {
        return;
    }

    // Menor folga de pilha entre as tarefas acompanhadas (palavras -> bytes)
    uint32_t minStack = 0;
    for (size_t i = 0; i < m_taskCount; i++) {
        uint32_t freeBytes = uxTaskGetStackHighWaterMark(m_tasks[i]) * sizeof(StackType_t);
        if (i == 0 || freeBytes < minStack) {
            minStack = freeBytes;
        }
    }
    stats.minStackFree = minStack;

    m_stats = stats;
    xSemaphoreGive(m_mutex);

    checkThresholds(stats);
}

void SystemMonitor::checkThresholds(const SystemStats &stats) {
    if (stats.freeHeap < LOW_HEAP_WARNING) {
        if (!m_lowHeapReported) {
            LOG_WARN(MODULE_NAME, "Heap baixo: %u bytes livres", (unsigned)stats.freeHeap);
            m_lowHeapReported = true;
        }
    } else {
        m_lowHeapReported = false;
    }

    if (m_taskCount > 0 && stats.minStackFree < LOW_STACK_WARNING && !m_lowStackReported) {
        LOG_WARN(MODULE_NAME, "Pilha quase esgotada: %u bytes livres", (unsigned)stats.minStackFree);
        m_lowStackReported = true;
    }
}

void SystemMonitor::update() {
    uint32_t now = millis();
    if (now - m_lastRefreshMs < 1000) {
        return;
    }
    m_lastRefreshMs = now;

    refreshStats();

    if (now - m_lastIntegrityMs >= HEAP_CHECK_INTERVAL) {
        m_lastIntegrityMs = now;
        checkHeapIntegrity();
    }
}

SystemStats SystemMonitor::getStats() {
    SystemStats stats;
    if (m_mutex && xSemaphoreTake(m_mutex, pdMS_TO_TICKS(100)) == pdTRUE) {
        stats = m_stats;
        xSemaphoreGive(m_mutex);
    }
    return stats;
}

bool SystemMonitor::checkHeapIntegrity() {
    if (heap_caps_check_integrity_all(true)) {
        return true;
    }

    LOG_FATAL(MODULE_NAME, "Corrupção de heap detectada");

    // Em depuração o estado é mantido para inspeção
    if (!DEBUG_MODE) {
        restart("Heap corrompido");
    }
    return false;
}

void SystemMonitor::restart(const char *reason) {
    LOG_FATAL(MODULE_NAME, "Reiniciando: %s", reason);

    // Serial direto como reserva, o log pode depender de heap corrompido
    Serial.println();
    Serial.print("*** RESTART: ");
    Serial.println(reason);
    Serial.flush();

    delay(100);
    ESP.restart();
}
