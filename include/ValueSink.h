/**
 * @file ValueSink.h
 * @brief Destino das mensagens de controle enviadas a cada ciclo.
 */

#ifndef VALUE_SINK_H
#define VALUE_SINK_H

/**
 * Consumidor "push" do valor condicionado (ex.: mesa de mixagem via OSC).
 */
class ValueSink {
public:
    virtual ~ValueSink() {}

    /**
     * Envia o valor final do fader.
     *
     * @param value Valor em [0, 1].
     * @return true se a mensagem foi entregue ao transporte.
     */
    virtual bool send(float value) = 0;
};

#endif // VALUE_SINK_H
