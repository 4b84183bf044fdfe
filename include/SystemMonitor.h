/**
 * @file SystemMonitor.h
 * @brief Watchdog das tarefas e saúde de memória do firmware.
 */

#ifndef SYSTEM_MONITOR_H
#define SYSTEM_MONITOR_H

#include <Arduino.h>
#include <esp_task_wdt.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include "Config.h"
#include "DataTypes.h"

// Tarefas acompanhadas pelo monitor (amostragem e serviços)
#define MONITOR_MAX_TRACKED_TASKS 2

/**
 * Singleton que mantém o Task Watchdog e amostra heap e pilhas.
 *
 * Cada tarefa de longa duração chama watchCurrentTask() uma vez e feed()
 * a cada volta do seu laço. update() roda na tarefa de serviços.
 */
class SystemMonitor {
public:
    static SystemMonitor &getInstance();

    /**
     * Cria o mutex de estatísticas e configura o watchdog.
     *
     * @return false se o mutex não pôde ser criado.
     */
    bool init();

    /**
     * Inscreve a tarefa chamadora no watchdog e passa a acompanhar sua pilha.
     *
     * @return true se inscrita (ou se o watchdog está desativado).
     */
    bool watchCurrentTask();

    /**
     * Alimenta o watchdog da tarefa chamadora.
     */
    void feed();

    /**
     * Atualiza as estatísticas (no máximo uma vez por segundo) e roda as
     * verificações periódicas.
     */
    void update();

    /**
     * @return Cópia das últimas estatísticas.
     */
    SystemStats getStats();

    /**
     * Reinicia o ESP32 após registrar o motivo.
     */
    void restart(const char *reason);

private:
    SystemMonitor();

    SystemMonitor(const SystemMonitor&) = delete;
    SystemMonitor& operator=(const SystemMonitor&) = delete;

    bool setupWatchdog();
    void refreshStats();
    void checkThresholds(const SystemStats &stats);
    bool checkHeapIntegrity();

    static SystemMonitor *s_instance;

    SemaphoreHandle_t m_mutex;
    SystemStats m_stats;                 // Protegido por m_mutex
    bool m_watchdogActive;

    TaskHandle_t m_tasks[MONITOR_MAX_TRACKED_TASKS];
    size_t m_taskCount;

    uint32_t m_lastRefreshMs;
    uint32_t m_lastIntegrityMs;
    bool m_lowHeapReported;
    bool m_lowStackReported;
};

#endif // SYSTEM_MONITOR_H
