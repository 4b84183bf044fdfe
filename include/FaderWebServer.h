/**
 * @file FaderWebServer.h
 * @brief Servidor web assíncrono com a leitura do fader e o diagnóstico.
 */

#ifndef FADER_WEB_SERVER_H
#define FADER_WEB_SERVER_H

#include <Arduino.h>
#include <AsyncTCP.h>
#include <ESPAsyncWebServer.h>
#include <ArduinoJson.h>
#include "Config.h"
#include "DataTypes.h"
#include "FaderController.h"
#include "OscSender.h"
#include "SharedReading.h"

/**
 * Superfície HTTP de consulta ("pull").
 *
 * Os handlers rodam na tarefa do AsyncTCP e apenas copiam o último valor
 * publicado; nunca acionam os pinos.
 */
class FaderWebServer {
private:
    AsyncWebServer m_server;               // Servidor web assíncrono
    const FaderConfig &m_config;           // Configuração (resumo em /status)
    SharedReading &m_shared;               // Última leitura publicada
    FaderController &m_controller;         // Contadores do laço
    const OscSender *m_oscSender;          // nullptr se o envio estiver desabilitado

    // HTML da página principal (armazenado em PROGMEM para economizar RAM)
    static const char INDEX_HTML[] PROGMEM;

    /**
     * Handler para a rota principal.
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handleRoot(AsyncWebServerRequest *request);

    /**
     * Handler para a leitura bruta: {"value": contagem, "timestamp": epoch}.
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handlePotentiometer(AsyncWebServerRequest *request);

    /**
     * Handler de liveness (texto "OK").
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handleHealth(AsyncWebServerRequest *request);

    /**
     * Handler para o diagnóstico completo.
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handleStatus(AsyncWebServerRequest *request);

    /**
     * Handler para a rota de logs do sistema.
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handleLogs(AsyncWebServerRequest *request);

    /**
     * Handler para requisições não encontradas.
     *
     * @param request Ponteiro para a requisição HTTP.
     */
    void handleNotFound(AsyncWebServerRequest *request);

    /**
     * Adiciona o resumo da configuração ativa ao documento.
     *
     * @param json Objeto JSON de destino.
     */
    void appendConfig(JsonObject &json) const;

public:
    /**
     * Construtor do servidor web.
     *
     * @param port Porta para o servidor web.
     * @param config Configuração do fader.
     * @param shared Célula com a última leitura.
     * @param controller Controlador do laço de amostragem.
     * @param oscSender Sender OSC ou nullptr.
     */
    FaderWebServer(uint16_t port, const FaderConfig &config, SharedReading &shared,
                   FaderController &controller, const OscSender *oscSender);

    /**
     * Registra as rotas e inicia o servidor.
     *
     * @return true se a inicialização foi bem-sucedida.
     */
    bool begin();
};

#endif // FADER_WEB_SERVER_H
