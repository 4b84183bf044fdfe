/**
 * @file OscSender.h
 * @brief Envia o valor do fader para a mesa de mixagem via OSC/UDP.
 */

#ifndef OSC_SENDER_H
#define OSC_SENDER_H

#include <Arduino.h>
#include <WiFi.h>
#include <WiFiUdp.h>
#include <atomic>
#include "DataTypes.h"
#include "PushTarget.h"
#include "ValueSink.h"

class OscSender : public ValueSink {
public:
    /**
     * @brief Construtor.
     * @param config Destino e endereço OSC (deve sobreviver ao sender).
     */
    explicit OscSender(const PushSinkConfig& config);

    /**
     * @brief Abre a porta UDP local.
     *
     * Um destino com IP literal já fica disponível aqui; nomes são
     * resolvidos depois por refreshTarget().
     *
     * @return false se o endereço OSC for inválido ou a porta não abrir.
     */
    bool begin();

    /**
     * @brief Resolve o host configurado quando o enlace muda de geração.
     *
     * Pode bloquear na consulta DNS, por isso roda na tarefa de serviços
     * e nunca no laço de amostragem. Falhas são repetidas a cada
     * OSC_RESOLVE_RETRY_MS enquanto a geração não muda.
     */
    void refreshTarget();

    /**
     * @brief Envia uma mensagem OSC com o valor final do fader.
     *
     * Não faz DNS: usa o último endereço publicado por refreshTarget().
     *
     * @param value Valor em [0, 1].
     * @return false sem rede, sem destino conhecido ou se o datagrama não
     *         puder ser enviado.
     */
    bool send(float value) override;

    /**
     * @return Número de datagramas enviados com sucesso.
     */
    uint32_t getSentCount() const { return m_sentCount.load(); }

private:
    const PushSinkConfig& m_config;
    WiFiUDP m_udp;
    PushTarget m_target;
    bool m_started;
    std::atomic<uint32_t> m_sentCount;
};

#endif // OSC_SENDER_H
