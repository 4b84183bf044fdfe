/**
 * @file FaderController.h
 * @brief Ciclo de amostragem, condicionamento e publicação do fader.
 */

#ifndef FADER_CONTROLLER_H
#define FADER_CONTROLLER_H

#include <mutex>
#include <stdint.h>
#include "AnalogSampler.h"
#include "Clock.h"
#include "DataTypes.h"
#include "RateLimiter.h"
#include "SharedReading.h"
#include "ValueSink.h"

/**
 * Resultado de um ciclo do laço de amostragem.
 */
enum class CycleResult : uint8_t {
    OK,             // Leitura publicada (e enviada, se o envio estiver habilitado)
    SAMPLE_FAILED,  // Falha nos pinos: ciclo descartado, valor anterior mantido
    PUSH_FAILED     // Leitura publicada, envio OSC falhou
};

/**
 * Coordena um ciclo completo:
 * amostragem -> normalização -> curva -> limitador -> publicação.
 *
 * É o único escritor de SharedReading e o único dono do RateLimiter.
 * runCycle() deve ser chamado sempre pela mesma tarefa.
 */
class FaderController {
private:
    const FaderConfig &m_config;
    AnalogSampler &m_sampler;
    Clock &m_clock;
    SharedReading &m_shared;
    ValueSink *m_pushSink;          // nullptr = envio desabilitado

    RateLimiter m_limiter;
    uint32_t m_sequence;

    // Lidos pela tarefa web; atualizados juntos para que um instantâneo
    // nunca tenha mais falhas que ciclos
    mutable std::mutex m_statsMutex;
    CycleStats m_stats;

    CycleResult finishCycle(CycleResult result);

    // Impede cópia e atribuição
    FaderController(const FaderController&) = delete;
    FaderController& operator=(const FaderController&) = delete;

public:
    /**
     * Construtor do controlador.
     *
     * @param config Configuração imutável do fader.
     * @param sampler Amostrador RC.
     * @param clock Fonte de tempo (limitador e timestamps).
     * @param shared Célula compartilhada com os leitores.
     * @param pushSink Destino das mensagens de controle, ou nullptr.
     */
    FaderController(const FaderConfig &config, AnalogSampler &sampler, Clock &clock,
                    SharedReading &shared, ValueSink *pushSink);

    /**
     * Executa um ciclo completo.
     *
     * Falhas nunca se propagam além do ciclo: o laço continua e o último
     * valor publicado permanece visível.
     *
     * @return Resultado do ciclo.
     */
    CycleResult runCycle();

    /**
     * Aplica a cadeia de condicionamento a uma contagem bruta.
     *
     * Avança o limitador de slew; não publica nada.
     *
     * @param raw Contagem bruta.
     * @param nowMs Instante atual em milissegundos.
     * @return Leitura com todos os estágios preenchidos (exceto timestamp e sequência).
     */
    FaderReading condition(uint32_t raw, uint32_t nowMs);

    /**
     * @return Contadores do laço (seguro para chamar de outra tarefa).
     */
    CycleStats getStats() const;

    /**
     * @return true se há um destino de envio configurado.
     */
    bool isPushEnabled() const { return m_pushSink != nullptr; }
};

#endif // FADER_CONTROLLER_H
