/**
 * @file PushTarget.h
 * @brief Endereço de destino do envio, resolvido fora do laço de amostragem.
 */

#ifndef PUSH_TARGET_H
#define PUSH_TARGET_H

#include <atomic>
#include <stdint.h>

/**
 * Guarda o IPv4 de destino das mensagens de controle.
 *
 * A tarefa de serviços decide quando resolver o nome (shouldResolve) e
 * publica o resultado; a tarefa de amostragem só lê o endereço com get(),
 * sem nunca esperar por DNS. Um endereço antigo continua valendo até ser
 * substituído.
 *
 * Todos os métodos, exceto get(), devem ser chamados pela mesma tarefa.
 */
class PushTarget {
private:
    std::atomic<uint32_t> m_address;   // 0 = desconhecido
    bool m_literal;                    // Host configurado já era um IP
    bool m_resolved;                   // m_resolvedGeneration é válido
    uint32_t m_resolvedGeneration;
    bool m_failed;                     // Última tentativa desta geração falhou
    uint32_t m_failedGeneration;
    uint32_t m_lastFailureMs;
    uint32_t m_retryMs;

    PushTarget(const PushTarget&) = delete;
    PushTarget& operator=(const PushTarget&) = delete;

public:
    /**
     * @param retryMs Intervalo mínimo entre tentativas que falharam.
     */
    explicit PushTarget(uint32_t retryMs);

    /**
     * Fixa um endereço literal; nenhuma resolução será pedida depois.
     *
     * @param address IPv4 no formato de IPAddress (diferente de 0).
     */
    void setLiteral(uint32_t address);

    /**
     * Indica se vale a pena consultar o DNS agora.
     *
     * @param linkGeneration Geração atual do enlace WiFi.
     * @param nowMs Instante atual em milissegundos.
     * @return true se ainda não há resolução para esta geração e o
     *         intervalo de nova tentativa já passou.
     */
    bool shouldResolve(uint32_t linkGeneration, uint32_t nowMs) const;

    /**
     * Registra uma resolução bem-sucedida.
     *
     * @return true se o endereço mudou.
     */
    bool publish(uint32_t address, uint32_t linkGeneration);

    /**
     * Registra uma resolução que falhou (o endereço anterior é mantido).
     */
    void recordFailure(uint32_t linkGeneration, uint32_t nowMs);

    /**
     * Lê o endereço atual. Seguro de qualquer tarefa, nunca bloqueia.
     *
     * @param address Recebe o IPv4.
     * @return false enquanto nenhum endereço foi conhecido.
     */
    bool get(uint32_t &address) const;
};

#endif // PUSH_TARGET_H
