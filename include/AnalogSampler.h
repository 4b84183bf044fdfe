/**
 * @file AnalogSampler.h
 * @brief Conversão pseudo-analógica por tempo de carga RC.
 */

#ifndef ANALOG_SAMPLER_H
#define ANALOG_SAMPLER_H

#include <stdint.h>
#include "Clock.h"
#include "DataTypes.h"
#include "PinPair.h"

/**
 * Mede a posição do potenciômetro usando apenas pinos digitais.
 *
 * Cada leitura descarrega o capacitor pelo pino B, carrega a rede pelo
 * pino A (através da resistência do potenciômetro) e conta quantas
 * iterações de polling o pino B leva para atingir nível alto.
 *
 * A unidade é iteração de laço, não tempo: o valor é relativo e depende
 * da CPU. Mais resistência resulta em contagem maior.
 */
class AnalogSampler {
private:
    PinPair &m_pins;
    Clock &m_clock;
    const SamplerConfig &m_config;

    /**
     * Fase de descarga: A em alta impedância, B em nível baixo.
     *
     * @return false se algum pino recusou a configuração.
     */
    bool discharge();

    /**
     * Fases de carga e contagem.
     *
     * @param count Recebe o número de iterações até B ler nível alto.
     * @return false se algum pino falhou.
     */
    bool chargeTime(uint32_t &count);

public:
    /**
     * Construtor do amostrador.
     *
     * @param pins Capacidade de pinos (deve sobreviver ao amostrador).
     * @param clock Fonte de tempo para a espera de descarga.
     * @param config Pinos, tempo de descarga e teto de contagem.
     */
    AnalogSampler(PinPair &pins, Clock &clock, const SamplerConfig &config);

    /**
     * Realiza um ciclo completo de descarga e carga.
     *
     * Atingir o teto de iterações não é erro: retorna o próprio teto,
     * que representa resistência máxima ou circuito aberto.
     *
     * @param count Recebe a contagem bruta em [0, maxCount].
     * @return false apenas em falha da capacidade de pinos (sem nova tentativa).
     */
    bool read(uint32_t &count);

    /**
     * @return Teto de iterações configurado.
     */
    uint32_t getMaxCount() const { return m_config.maxCount; }
};

#endif // ANALOG_SAMPLER_H
