/**
 * @file WiFiManager.h
 * @brief Mantém o enlace WiFi da estação que leva as mensagens OSC.
 */

#ifndef WIFI_MANAGER_H
#define WIFI_MANAGER_H

#include <Arduino.h>
#include <WiFi.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <atomic>
#include "Config.h"

/**
 * Estado do enlace visto pela tarefa de serviços.
 */
enum class LinkState : uint8_t {
    IDLE,        // connect() ainda não chamado
    CONNECTING,  // Aguardando IP após WiFi.begin()
    CONNECTED,   // IP obtido
    COOLDOWN     // Tentativas esgotadas, aguardando WIFI_RECOVERY_COOLDOWN
};

/**
 * Singleton do enlace WiFi.
 *
 * O handler de eventos do driver só atualiza flags e o IP; toda a lógica
 * de reconexão (backoff exponencial e pausa longa após esgotar as
 * tentativas) roda em update(), na tarefa de serviços.
 *
 * getIPString() e getRSSI() podem ser chamados de qualquer tarefa (a de
 * serviços e a do servidor HTTP).
 */
class WiFiManager {
public:
    static WiFiManager &getInstance();

    /**
     * Inicia a associação (não bloqueante).
     *
     * @param ssid Nome da rede.
     * @param password Senha da rede (pode ser vazia).
     * @return false se o SSID estiver vazio.
     */
    bool connect(const char *ssid, const char *password);

    /**
     * Bloqueia até obter IP ou estourar o prazo, piscando o LED.
     *
     * @param timeoutMs Prazo em milissegundos.
     * @return true se conectou.
     */
    bool waitForConnection(uint32_t timeoutMs);

    /**
     * Avança a máquina de estados. Chamado periodicamente.
     *
     * @return true se conectado.
     */
    bool update();

    /**
     * @return true se há IP válido.
     */
    bool isConnected() const { return m_hasIp; }

    /**
     * Número de vezes que o enlace obteve IP desde o boot.
     *
     * Quem guarda recursos dependentes da rede (DNS, socket) compara com o
     * valor anterior para saber se precisa refazê-los.
     */
    uint32_t getLinkGeneration() const { return m_generation.load(); }

    /**
     * @param buffer Destino (mínimo 16 bytes).
     * @param size Tamanho do buffer.
     * @return buffer com o IP, ou "0.0.0.0" sem conexão.
     */
    char *getIPString(char *buffer, size_t size) const;

    /**
     * @return RSSI em dBm, 0 sem conexão. Lido do driver no máximo uma vez por segundo.
     */
    int16_t getRSSI();

private:
    WiFiManager();

    WiFiManager(const WiFiManager&) = delete;
    WiFiManager& operator=(const WiFiManager&) = delete;

    static void onWiFiEvent(WiFiEvent_t event, WiFiEventInfo_t info);

    void scheduleRetry(uint32_t nowMs);
    void startAttempt(uint32_t nowMs);
    void markConnected(bool recovered);

    static WiFiManager *s_instance;

    const char *m_ssid;
    const char *m_password;

    LinkState m_state;
    volatile bool m_hasIp;               // Escrito pelo handler de eventos
    std::atomic<uint32_t> m_generation;

    uint8_t m_attempts;                  // Tentativas desde a última conexão
    uint32_t m_nextAttemptMs;

    std::atomic<uint32_t> m_ip;          // IPv4 no formato de IPAddress

    SemaphoreHandle_t m_rssiMutex;
    int16_t m_rssi;                      // Protegido por m_rssiMutex
    uint32_t m_rssiReadMs;               // Protegido por m_rssiMutex
};

#endif // WIFI_MANAGER_H
