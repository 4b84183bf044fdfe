/**
 * @file Config.h
 * @brief Define as configurações gerais do sistema.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>

// Versão do firmware
#define FIRMWARE_VERSION          "1.2.0"

// Configurações de WiFi
#define WIFI_SSID                 "Estudio-Mix"
#define WIFI_PASSWORD             ""
#define WIFI_CONNECTION_TIMEOUT   10000  // Tempo máximo para conexão WiFi (ms)
#define WIFI_MAX_RECONNECT_ATTEMPTS 20   // Máximo de tentativas de reconexão
#define WIFI_RECONNECT_INTERVAL   2000   // Intervalo base entre tentativas (ms)
#define WIFI_RECOVERY_COOLDOWN    300000 // Pausa após esgotar as tentativas (ms)

// Portas e interfaces
#define WEB_SERVER_PORT           80
#define SERIAL_BAUD_RATE          115200

// Sincronização de horário (timestamps de captura)
#define NTP_SERVER                "pool.ntp.org"
#define NTP_SYNC_TIMEOUT          5000   // Espera máxima pela primeira sincronização (ms)

// ==========================================
// Configurações do potenciômetro (RC)
// ==========================================

#define POT_PIN_A                 18     // Pino de carga (alimenta a rede RC pelo potenciômetro)
#define POT_PIN_B                 19     // Pino de descarga/leitura (nó do capacitor)
#define POT_DISCHARGE_SETTLE_MS   4      // Tempo de descarga do capacitor (ms)
#define POT_MAX_COUNT             1000000UL // Teto de iterações da contagem de carga

// Faixa de normalização (contagens brutas)
#define POT_RAW_MIN               0UL
#define POT_RAW_MAX               100000UL

// ==========================================
// Condicionamento do sinal (fader)
// ==========================================

#define FADER_CURVE               VolumeCurve::LOGARITHMIC
#define FADER_DB_MIN              -60.0f // Piso da curva logarítmica (dB)
#define FADER_DB_MAX              0.0f   // Topo da curva logarítmica (dB)

#define FADER_RATE_LIMIT_ENABLED  true
#define FADER_MAX_RATE_UP         0.05f  // Subida máxima por segundo (fração de escala)
#define FADER_MAX_RATE_DOWN       0.30f  // Descida máxima por segundo (fração de escala)

#define FADER_SAMPLE_INTERVAL     1000   // Intervalo entre ciclos de amostragem (ms)

// ==========================================
// Saída OSC (mesa de mixagem)
// ==========================================

#define OSC_ENABLED               true
#define OSC_TARGET_HOST           "192.168.1.50"
#define OSC_TARGET_PORT           10023
#define OSC_LOCAL_PORT            10024
#define OSC_ADDRESS               "/ch/01/mix/fader"
#define OSC_ADDRESS_MAX_SIZE      64
#define OSC_HOST_MAX_SIZE         64
#define OSC_PACKET_MAX_SIZE       96
#define OSC_RESOLVE_RETRY_MS      5000   // Espera após falha de DNS (ms)

// Configurações de memória
#define JSON_BUFFER_SIZE          1024   // Tamanho do documento JSON de status (bytes)
#define LOW_HEAP_WARNING          20000  // Aviso abaixo deste heap livre (bytes)
#define LOW_STACK_WARNING         512    // Aviso abaixo desta folga de pilha (bytes)
#define HEAP_CHECK_INTERVAL       10000  // Intervalo da verificação de integridade (ms)

// Configurações de watchdog
#define WATCHDOG_TIMEOUT          5000   // Tempo limite do watchdog (ms)
#define ENABLE_TASK_WATCHDOG      true   // Habilita o Task Watchdog

// Configurações de CPU
#define TASK_SENSOR_CORE          0      // Core para tarefa de amostragem
#define TASK_WEB_CORE             1      // Core para tarefa de serviços
#define TASK_STACK_SIZE           4096   // Tamanho da pilha para tarefas (bytes)
#define TASK_PRIORITY_SENSOR      2      // Prioridade da tarefa de amostragem
#define TASK_PRIORITY_WEB         1      // Prioridade da tarefa de serviços

// Debug
#ifndef DEBUG_MODE
#define DEBUG_MODE                false  // Modo de depuração
#endif

// ==========================================
// Configurações do Sistema de Logging
// ==========================================

/**
 * @enum LogLevel
 * @brief Níveis de log para o sistema de logging otimizado.
 */
enum class LogLevel {
    TRACE = 0,  // Informações extremamente detalhadas
    DEBUG = 1,  // Informações para depuração
    INFO = 2,   // Informações operacionais normais
    WARN = 3,   // Avisos que não impedem o funcionamento
    ERROR = 4,  // Erros que afetam funcionalidades
    FATAL = 5,  // Erros críticos que comprometem o sistema
    NONE = 6    // Desabilita todos os logs
};

// Modo de produção - define comportamento de logs
#ifndef PRODUCTION_MODE
#define PRODUCTION_MODE              false  // Modo de produção
#endif

// Nível mínimo de log para saída serial
#define LOG_LEVEL_SERIAL            (PRODUCTION_MODE ? LogLevel::ERROR : LogLevel::INFO)

// Nível mínimo para armazenamento em buffer circular
#define LOG_LEVEL_MEMORY            LogLevel::INFO

// Tamanho do buffer circular (número de mensagens)
#define LOG_BUFFER_SIZE             50

// Tamanho máximo de uma mensagem de log (bytes)
#define LOG_MAX_MESSAGE_SIZE        256

// Tamanho máximo do nome de um módulo
#define LOG_MODULE_NAME_MAX_SIZE    16

#endif // CONFIG_H
