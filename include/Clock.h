/**
 * @file Clock.h
 * @brief Fonte de tempo usada pelo núcleo de amostragem.
 */

#ifndef CLOCK_H
#define CLOCK_H

#include <stdint.h>

/**
 * Abstrai millis()/delay()/time() para que o núcleo rode também no host.
 */
class Clock {
public:
    virtual ~Clock() {}

    /**
     * @return Milissegundos monotônicos desde o boot.
     */
    virtual uint32_t nowMs() = 0;

    /**
     * @return Segundos desde epoch, ou 0 se o relógio ainda não foi sincronizado.
     */
    virtual uint32_t epochSeconds() = 0;

    /**
     * Espera limitada em tempo real.
     *
     * @param ms Duração da espera em milissegundos.
     */
    virtual void delayMs(uint32_t ms) = 0;
};

#endif // CLOCK_H
