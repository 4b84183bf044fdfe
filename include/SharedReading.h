/**
 * @file SharedReading.h
 * @brief Célula do último valor publicado pelo laço de amostragem.
 */

#ifndef SHARED_READING_H
#define SHARED_READING_H

#include <mutex>
#include "DataTypes.h"

/**
 * Único ponto de estado compartilhado entre tarefas.
 *
 * Um único escritor (tarefa de amostragem) e qualquer número de leitores
 * (handlers HTTP). Ambos os lados seguram o mutex apenas durante a cópia
 * da estrutura, então uma leitura nunca bloqueia o escritor por mais
 * que uma cópia.
 */
class SharedReading {
private:
    mutable std::mutex m_mutex;
    FaderReading m_reading;

    // Impede cópia e atribuição
    SharedReading(const SharedReading&) = delete;
    SharedReading& operator=(const SharedReading&) = delete;

public:
    SharedReading();

    /**
     * Substitui o valor visível para os leitores.
     *
     * @param reading Leitura completa do ciclo.
     */
    void publish(const FaderReading &reading);

    /**
     * Obtém uma cópia do último valor publicado.
     *
     * Antes do primeiro ciclo bem-sucedido todos os campos valem zero.
     *
     * @return Cópia da leitura.
     */
    FaderReading snapshot() const;
};

#endif // SHARED_READING_H
