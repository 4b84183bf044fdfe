/**
 * @file PinPair.h
 * @brief Interface mínima para o par de pinos digitais da rede RC.
 */

#ifndef PIN_PAIR_H
#define PIN_PAIR_H

#include <stdint.h>

/**
 * Capacidade exigida pelo amostrador: dois pinos digitais, cada um
 * comutável entre entrada e saída, legível e acionável.
 *
 * Todas as operações retornam false em caso de falha do driver
 * (pino inexistente, modo rejeitado). O chamador decide o que fazer.
 */
class PinPair {
public:
    enum PinId {
        PIN_A,  // Pino de carga
        PIN_B   // Pino de descarga/leitura
    };

    enum PinMode {
        PIN_INPUT,   // Alta impedância
        PIN_OUTPUT
    };

    enum PinLevel {
        PIN_LOW,
        PIN_HIGH
    };

    virtual ~PinPair() {}

    /**
     * Configura a direção de um pino.
     *
     * @param pin Pino alvo.
     * @param mode Entrada ou saída.
     * @return true se o driver aceitou a configuração.
     */
    virtual bool setMode(PinId pin, PinMode mode) = 0;

    /**
     * Aciona um pino configurado como saída.
     *
     * @param pin Pino alvo.
     * @param level Nível lógico desejado.
     * @return true se a escrita foi aceita.
     */
    virtual bool write(PinId pin, PinLevel level) = 0;

    /**
     * Lê o nível lógico de um pino.
     *
     * @param pin Pino alvo.
     * @param level Recebe o nível lido.
     * @return true se a leitura foi realizada.
     */
    virtual bool read(PinId pin, PinLevel &level) = 0;
};

#endif // PIN_PAIR_H
