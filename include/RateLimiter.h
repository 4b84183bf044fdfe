/**
 * @file RateLimiter.h
 * @brief Limitador de slew com velocidades independentes de subida e descida.
 */

#ifndef RATE_LIMITER_H
#define RATE_LIMITER_H

#include <stdint.h>
#include "DataTypes.h"

/**
 * Move o valor atual em direção ao alvo limitado por uma taxa máxima
 * por segundo. O passo é proporcional ao tempo decorrido desde a última
 * atualização, então jitter no agendamento não altera a velocidade.
 *
 * O volume sobe devagar (evita saltos de intensidade) e desce rápido.
 * Pertence exclusivamente ao laço de amostragem; não é thread-safe.
 */
class RateLimiter {
private:
    float m_maxRateUp;      // Fração de escala por segundo (subida)
    float m_maxRateDown;    // Fração de escala por segundo (descida)
    float m_current;        // Valor de saída atual
    uint32_t m_lastUpdateMs;

public:
    // Diferença abaixo da qual o valor salta direto para o alvo
    static constexpr float SNAP_EPSILON = 0.001f;

    /**
     * Construtor do limitador.
     *
     * @param config Taxas máximas de subida e descida.
     * @param nowMs Instante de referência para a primeira atualização.
     * @param initial Valor inicial da saída.
     */
    RateLimiter(const RateLimiterConfig &config, uint32_t nowMs, float initial = 0.0f);

    /**
     * Avança o valor em direção ao alvo.
     *
     * @param target Valor desejado.
     * @param nowMs Instante atual em milissegundos.
     * @return Valor efetivo, sempre em [0, 1].
     */
    float update(float target, uint32_t nowMs);

    /**
     * Define o valor atual diretamente, sem limitação.
     *
     * @param value Novo valor (limitado a [0, 1]).
     * @param nowMs Novo instante de referência.
     */
    void reset(float value, uint32_t nowMs);

    /**
     * @return Valor atual da saída.
     */
    float current() const { return m_current; }
};

#endif // RATE_LIMITER_H
