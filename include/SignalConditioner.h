/**
 * @file SignalConditioner.h
 * @brief Funções puras de condicionamento do sinal do potenciômetro.
 */

#ifndef SIGNAL_CONDITIONER_H
#define SIGNAL_CONDITIONER_H

#include <stdint.h>
#include "DataTypes.h"

namespace SignalConditioner {

    // Abaixo deste valor a conversão para dB retorna o piso da faixa
    constexpr float DB_FLOOR_EPSILON = 0.0001f;

    /**
     * Converte a contagem bruta em fração linear.
     *
     * A contagem é limitada a [min, max] antes da divisão. Com max <= min
     * o resultado é sempre 0 (configuração degenerada, não é erro).
     *
     * @param raw Contagem bruta.
     * @param min Contagem correspondente a 0.
     * @param max Contagem correspondente a 1.
     * @return Fração em [0, 1].
     */
    float normalize(uint32_t raw, uint32_t min, uint32_t max);

    /**
     * Aplica a curva de volume à posição linear.
     *
     * @param linear Posição linear (limitada a [0, 1]).
     * @param curve Curva selecionada.
     * @param dbMin Piso em dB (apenas LOGARITHMIC).
     * @param dbMax Topo em dB (apenas LOGARITHMIC).
     * @return Fração perceptual em [0, 1].
     */
    float applyCurve(float linear, VolumeCurve curve, float dbMin, float dbMax);

    /**
     * Equivalente em dB da posição linear, para diagnóstico.
     *
     * @param linear Posição linear.
     * @param dbMin Piso em dB (retornado para posições ~0).
     * @param dbMax Topo em dB.
     * @return Valor em dB.
     */
    float linearToDb(float linear, float dbMin, float dbMax);

    /**
     * @param db Valor em dB.
     * @return Amplitude linear 10^(db/20).
     */
    float dbToAmplitude(float db);

    /**
     * @param curve Curva de volume.
     * @return Nome curto da curva ("linear", "logarithmic", "exponential").
     */
    const char* curveName(VolumeCurve curve);

} // namespace SignalConditioner

#endif // SIGNAL_CONDITIONER_H
