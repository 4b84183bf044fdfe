/**
 * @file DataTypes.h
 * @brief Define estruturas e tipos de dados do fader.
 *
 * Este cabeçalho não depende do core Arduino para que o núcleo de
 * condicionamento possa ser testado no host.
 */

#ifndef DATA_TYPES_H
#define DATA_TYPES_H

#include <stdint.h>
#include "Config.h"
#include "StringUtils.h"

/**
 * Curva de volume aplicada à posição linear do potenciômetro.
 * Selecionada na inicialização e imutável depois disso.
 */
enum class VolumeCurve : uint8_t {
    LINEAR,       // Identidade
    LOGARITHMIC,  // Taper de áudio (faixa em dB)
    EXPONENTIAL   // Aproximação barata: linear^2
};

/**
 * Faixa de contagens brutas usada para normalizar a leitura em [0, 1].
 * Se max <= min a normalização resulta sempre em 0.
 */
struct NormalizationRange {
    uint32_t min;
    uint32_t max;

    NormalizationRange() : min(POT_RAW_MIN), max(POT_RAW_MAX) {}
    NormalizationRange(uint32_t minCount, uint32_t maxCount) : min(minCount), max(maxCount) {}
};

/**
 * Faixa em decibéis da curva logarítmica e da conversão de diagnóstico.
 */
struct DecibelRange {
    float dbMin;
    float dbMax;

    DecibelRange() : dbMin(FADER_DB_MIN), dbMax(FADER_DB_MAX) {}
    DecibelRange(float minDb, float maxDb) : dbMin(minDb), dbMax(maxDb) {}
};

/**
 * Parâmetros do amostrador RC.
 */
struct SamplerConfig {
    uint8_t pinA;             // Pino de carga
    uint8_t pinB;             // Pino de descarga/leitura
    uint32_t settleMs;        // Tempo de descarga (ms)
    uint32_t maxCount;        // Teto de iterações da contagem

    SamplerConfig()
        : pinA(POT_PIN_A), pinB(POT_PIN_B),
          settleMs(POT_DISCHARGE_SETTLE_MS), maxCount(POT_MAX_COUNT) {}
};

/**
 * Limites de variação do limitador de slew (fração de escala por segundo).
 */
struct RateLimiterConfig {
    bool enabled;
    float maxRateUp;
    float maxRateDown;

    RateLimiterConfig()
        : enabled(FADER_RATE_LIMIT_ENABLED),
          maxRateUp(FADER_MAX_RATE_UP), maxRateDown(FADER_MAX_RATE_DOWN) {}
    RateLimiterConfig(float up, float down)
        : enabled(true), maxRateUp(up), maxRateDown(down) {}
};

/**
 * Destino das mensagens de controle (OSC sobre UDP).
 */
struct PushSinkConfig {
    bool enabled;
    char host[OSC_HOST_MAX_SIZE];
    uint16_t port;
    uint16_t localPort;
    char address[OSC_ADDRESS_MAX_SIZE];

    PushSinkConfig() : enabled(OSC_ENABLED), port(OSC_TARGET_PORT), localPort(OSC_LOCAL_PORT) {
        StringUtils::safeCopyString(host, OSC_TARGET_HOST, sizeof(host));
        StringUtils::safeCopyString(address, OSC_ADDRESS, sizeof(address));
    }
};

/**
 * Configuração completa do fader.
 *
 * Montada uma única vez em setup() e passada por referência constante
 * para cada componente. Não há recarga em tempo de execução.
 */
struct FaderConfig {
    SamplerConfig sampler;
    NormalizationRange range;
    VolumeCurve curve;
    DecibelRange decibels;
    RateLimiterConfig rateLimiter;
    uint32_t sampleIntervalMs;
    PushSinkConfig pushSink;

    FaderConfig() : curve(FADER_CURVE), sampleIntervalMs(FADER_SAMPLE_INTERVAL) {}

    /**
     * Constrói a configuração a partir dos valores de Config.h.
     *
     * @return Configuração padrão do firmware.
     */
    static FaderConfig fromDefaults() {
        return FaderConfig();
    }
};

/**
 * Resultado de um ciclo de amostragem e condicionamento.
 * É o valor publicado para os leitores (rota HTTP) a cada ciclo.
 */
struct FaderReading {
    uint32_t rawCount;     // Contagem bruta da carga RC
    float linear;          // Posição normalizada [0, 1]
    float curved;          // Posição após a curva de volume [0, 1]
    float output;          // Valor final após o limitador [0, 1]
    float decibels;        // Equivalente em dB (diagnóstico)
    uint32_t timestamp;    // Momento da captura (segundos desde epoch, 0 se sem NTP)
    uint32_t capturedAtMs; // Momento da captura (ms desde boot)
    uint32_t sequence;     // Número do ciclo publicado (0 = nenhum ainda)

    FaderReading()
        : rawCount(0), linear(0.0f), curved(0.0f), output(0.0f), decibels(0.0f),
          timestamp(0), capturedAtMs(0), sequence(0) {}
};

/**
 * Contadores do laço de amostragem.
 */
struct CycleStats {
    uint32_t cycles;          // Ciclos executados
    uint32_t sampleFailures;  // Ciclos descartados por falha nos pinos
    uint32_t pushFailures;    // Envios OSC que falharam

    CycleStats() : cycles(0), sampleFailures(0), pushFailures(0) {}
};

/**
 * Estrutura para estatísticas do sistema.
 */
struct SystemStats {
    uint32_t freeHeap;          // Heap livre em bytes
    uint32_t minFreeHeap;       // Mínimo de heap livre já registrado
    uint16_t heapFragmentation; // Fragmentação do heap (percentual)
    uint32_t uptime;            // Tempo de atividade em segundos
    uint32_t minStackFree;      // Menor folga de pilha entre as tarefas (bytes)

    SystemStats() : freeHeap(0), minFreeHeap(0), heapFragmentation(0), uptime(0), minStackFree(0) {}
};

#endif // DATA_TYPES_H
