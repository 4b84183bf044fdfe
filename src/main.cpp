/**
 * @file main.cpp
 * @brief Arquivo principal do fader GPIO (potenciômetro RC para controle OSC).
 */

#include <Arduino.h>
#include "Config.h"
#include "DataTypes.h"
#include "Hardware.h"
#include "AnalogSampler.h"
#include "FaderController.h"
#include "FaderTelemetry.h"
#include "FaderWebServer.h"
#include "OscSender.h"
#include "SharedReading.h"
#include "SignalConditioner.h"
#include "WiFiManager.h"
#include "SystemMonitor.h"
#include "LogSystem.h"

// Define o nome do módulo para logging
#define MODULE_NAME "Main"

// Intervalo da tarefa de serviços (WiFi, estatísticas, watchdog)
#define SERVICE_TASK_INTERVAL     1000
// A cada quantos ciclos com falha de envio consecutiva um aviso é registrado
#define PUSH_FAILURE_LOG_EVERY    30

// Configuração imutável, montada uma única vez em setup()
static FaderConfig g_config;

// Instâncias dos componentes
Hardware::GpioPinPair *g_pins = nullptr;
Hardware::SystemClock *g_clock = nullptr;
SharedReading *g_sharedReading = nullptr;
AnalogSampler *g_sampler = nullptr;
OscSender *g_oscSender = nullptr;
FaderController *g_controller = nullptr;
FaderWebServer *g_webServer = nullptr;

// Tarefas FreeRTOS
TaskHandle_t g_samplerTask = nullptr;
TaskHandle_t g_serviceTask = nullptr;

/**
 * Interrompe a inicialização após um erro irrecuperável.
 *
 * @param reason Descrição do erro.
 */
static void haltSystem(const char *reason) {
    LOG_FATAL(MODULE_NAME, "ERRO: %s", reason);
    LOG_FATAL(MODULE_NAME, "Sistema parado");
    while (true) {
        delay(1000);
    }
}

/**
 * Tarefa de amostragem: único escritor da leitura compartilhada.
 *
 * Executa no core de sensores com período fixo. Falhas de um ciclo são
 * registradas e o laço continua; o último valor bom permanece publicado.
 *
 * @param pvParameters Parâmetros da tarefa (não utilizados).
 */
void samplerTaskFunc(void *pvParameters) {
    const TickType_t xFrequency = pdMS_TO_TICKS(g_config.sampleIntervalMs);
    TickType_t xLastWakeTime = xTaskGetTickCount();
    uint32_t consecutivePushFailures = 0;

    LOG_DEBUG(MODULE_NAME, "Tarefa de amostragem iniciada (Core %d)", xPortGetCoreID());

    SystemMonitor &monitor = SystemMonitor::getInstance();
    monitor.watchCurrentTask();

    while (true) {
        CycleResult result = g_controller->runCycle();

        switch (result) {
            case CycleResult::OK:
                if (consecutivePushFailures > 0) {
                    LOG_INFO(MODULE_NAME, "Envio OSC restabelecido após %u falhas", consecutivePushFailures);
                    consecutivePushFailures = 0;
                }
                break;

            case CycleResult::SAMPLE_FAILED:
                LOG_ERROR(MODULE_NAME, "Falha ao ler o potenciômetro, mantendo último valor");
                break;

            case CycleResult::PUSH_FAILED:
                if (consecutivePushFailures % PUSH_FAILURE_LOG_EVERY == 0) {
                    LOG_WARN(MODULE_NAME, "Falha ao enviar mensagem OSC (%u consecutivas)",
                             consecutivePushFailures + 1);
                }
                consecutivePushFailures++;
                break;
        }

        monitor.feed();

        // Executa no intervalo definido (preciso)
        vTaskDelayUntil(&xLastWakeTime, xFrequency);
    }
}

/**
 * Tarefa de serviços: reconexão WiFi, DNS do destino OSC, estatísticas e
 * linha de status.
 *
 * Executa no core web para não interferir com a amostragem.
 *
 * @param pvParameters Parâmetros da tarefa (não utilizados).
 */
void serviceTaskFunc(void *pvParameters) {
    const TickType_t xFrequency = pdMS_TO_TICKS(SERVICE_TASK_INTERVAL);
    TickType_t xLastWakeTime = xTaskGetTickCount();

    LOG_DEBUG(MODULE_NAME, "Tarefa de serviços iniciada (Core %d)", xPortGetCoreID());

    SystemMonitor &monitor = SystemMonitor::getInstance();
    monitor.watchCurrentTask();

    char statusLine[160];

    while (true) {
        WiFiManager::getInstance().update();
        if (g_oscSender) {
            g_oscSender->refreshTarget();
        }
        monitor.update();

        FaderTelemetry telemetry = FaderTelemetry::capture(*g_sharedReading, *g_controller, g_oscSender);
        LOG_STATUS("%s", telemetry.toConsoleString(statusLine, sizeof(statusLine)));

        monitor.feed();

        vTaskDelayUntil(&xLastWakeTime, xFrequency);
    }
}

void setup() {
    // Inicializa a comunicação serial
    Serial.begin(SERIAL_BAUD_RATE);
    delay(500); // Pequeno delay para estabilização

    CONSOLE_RESET();
    CONSOLE_BEGIN_SECTION("Fader GPIO v" FIRMWARE_VERSION);

    // Configuração fixa para toda a execução
    g_config = FaderConfig::fromDefaults();

    LOG_INFO(MODULE_NAME, "Curva %s (%.0f a %.0f dB), faixa bruta %lu-%lu, intervalo %lu ms",
             SignalConditioner::curveName(g_config.curve),
             g_config.decibels.dbMin, g_config.decibels.dbMax,
             (unsigned long)g_config.range.min, (unsigned long)g_config.range.max,
             (unsigned long)g_config.sampleIntervalMs);
    if (g_config.rateLimiter.enabled) {
        LOG_INFO(MODULE_NAME, "Limitador: subida %.2f/s, descida %.2f/s",
                 g_config.rateLimiter.maxRateUp, g_config.rateLimiter.maxRateDown);
    } else {
        LOG_INFO(MODULE_NAME, "Limitador desativado");
    }

    // Inicializa componentes - ORDEM É IMPORTANTE
    // 1. Hardware e serviços de sistema
    Hardware::setupPins();
    setCpuFrequencyMhz(240);

    if (!SystemMonitor::getInstance().init()) {
        haltSystem("Falha ao inicializar monitor do sistema");
    }

    // 2. Capacidade de pinos do potenciômetro (obrigatória)
    g_pins = new Hardware::GpioPinPair(g_config.sampler.pinA, g_config.sampler.pinB);
    if (!g_pins->begin()) {
        haltSystem("Pinos do potenciômetro indisponíveis");
    }

    g_clock = new Hardware::SystemClock();
    g_sharedReading = new SharedReading();
    g_sampler = new AnalogSampler(*g_pins, *g_clock, g_config.sampler);

    // 3. Rede e horário
    if (WiFiManager::getInstance().connect(WIFI_SSID, WIFI_PASSWORD) &&
        WiFiManager::getInstance().waitForConnection(WIFI_CONNECTION_TIMEOUT)) {
        Hardware::syncTime(NTP_SERVER, NTP_SYNC_TIMEOUT);
    } else {
        LOG_WARN(MODULE_NAME, "Sem WiFi na inicialização, timestamps serão 0 até a sincronização");
        // O SNTP sincroniza sozinho quando a rede voltar
        configTime(0, 0, NTP_SERVER);
    }

    // 4. Envio OSC (opcional: falha não impede o funcionamento)
    if (g_config.pushSink.enabled) {
        g_oscSender = new OscSender(g_config.pushSink);
        if (!g_oscSender->begin()) {
            LOG_WARN(MODULE_NAME, "Envio OSC desabilitado");
            delete g_oscSender;
            g_oscSender = nullptr;
        }
    } else {
        LOG_INFO(MODULE_NAME, "Envio OSC desabilitado por configuração");
    }

    // 5. Controlador (referência de tempo do limitador = agora)
    g_controller = new FaderController(g_config, *g_sampler, *g_clock, *g_sharedReading, g_oscSender);

    // 6. Servidor web
    g_webServer = new FaderWebServer(WEB_SERVER_PORT, g_config, *g_sharedReading,
                                     *g_controller, g_oscSender);
    if (!g_webServer->begin()) {
        haltSystem("Falha ao iniciar servidor web");
    }

    // 7. Tarefas FreeRTOS
    if (xTaskCreatePinnedToCore(
            samplerTaskFunc,
            "SamplerTask",
            TASK_STACK_SIZE,
            NULL,
            TASK_PRIORITY_SENSOR,
            &g_samplerTask,
            TASK_SENSOR_CORE) != pdPASS) {
        haltSystem("Falha ao criar tarefa de amostragem");
    }

    if (xTaskCreatePinnedToCore(
            serviceTaskFunc,
            "ServiceTask",
            TASK_STACK_SIZE,
            NULL,
            TASK_PRIORITY_WEB,
            &g_serviceTask,
            TASK_WEB_CORE) != pdPASS) {
        haltSystem("Falha ao criar tarefa de serviços");
    }

    LOG_INFO(MODULE_NAME, "Sistema inicializado com sucesso!");
    CONSOLE_END_SECTION();
}

void loop() {
    // Todo o trabalho acontece nas tarefas FreeRTOS
    delay(1000);
}
