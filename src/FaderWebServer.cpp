/**
 * @file FaderWebServer.cpp
 * @brief Implementação do servidor web do fader.
 */

#include "FaderWebServer.h"
#include "FaderTelemetry.h"
#include "LogSystem.h"
#include "SignalConditioner.h"
#include <new>

#define MODULE_NAME "WebServer"

// Página de acompanhamento: consulta /status periodicamente
const char FaderWebServer::INDEX_HTML[] PROGMEM = R"rawliteral(
<!DOCTYPE html>
<html lang="pt-br">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Fader GPIO</title>
<style>
  * { box-sizing: border-box; }
  body { margin: 0; background: #141418; color: #d8d8dc; font: 14px/1.5 monospace; }
  main { display: grid; grid-template-columns: 120px 1fr; gap: 24px; max-width: 640px; margin: 32px auto; padding: 0 16px; }
  .strip { background: #22222a; border: 1px solid #33333d; border-radius: 6px; padding: 12px; text-align: center; }
  .track { position: relative; height: 320px; width: 28px; margin: 8px auto; background: #0c0c10; border-radius: 4px; }
  .level { position: absolute; bottom: 0; left: 0; right: 0; height: 0%; border-radius: 4px;
           background: linear-gradient(to top, #2e8b57, #c9b037 75%, #c0392b); transition: height .4s; }
  .readout { font-size: 22px; color: #fff; }
  .label { color: #777; font-size: 11px; text-transform: uppercase; }
  table { width: 100%; border-collapse: collapse; }
  td { padding: 3px 6px; border-bottom: 1px solid #26262e; }
  td:first-child { color: #888; width: 45%; }
  caption { text-align: left; color: #6fa8dc; padding: 12px 6px 4px; }
</style>
</head>
<body>
<main>
  <section class="strip">
    <div class="label">CH 01</div>
    <div class="track"><div class="level" id="level"></div></div>
    <div class="readout" id="db">-</div>
    <div class="label">dB</div>
  </section>
  <section>
    <table>
      <caption>Leitura</caption>
      <tr><td>Saída</td><td id="output">-</td></tr>
      <tr><td>Contagem bruta</td><td id="raw">-</td></tr>
      <tr><td>Linear / curva</td><td id="linear">-</td></tr>
      <tr><td>Sequência</td><td id="sequence">-</td></tr>
      <tr><td>Idade (ms)</td><td id="age">-</td></tr>
    </table>
    <table>
      <caption>Envio</caption>
      <tr><td>OSC</td><td id="osc">-</td></tr>
      <tr><td>Falhas leitura/envio</td><td id="failures">-</td></tr>
    </table>
    <table>
      <caption>Sistema</caption>
      <tr><td>Firmware</td><td id="firmware">-</td></tr>
      <tr><td>Tempo ativo</td><td id="uptime">-</td></tr>
      <tr><td>Heap livre</td><td id="heap">-</td></tr>
      <tr><td>WiFi</td><td id="wifi">-</td></tr>
    </table>
  </section>
</main>
<script>
  const $ = (id) => document.getElementById(id);
  function show(id, text) { if ($(id).textContent !== text) $(id).textContent = text; }

  function render(s) {
    const r = s.reading, c = s.controller, sys = s.system;
    $('level').style.height = (r.output * 100).toFixed(1) + '%';
    show('db', r.sequence ? r.db.toFixed(1) : '-');
    show('output', r.output.toFixed(3));
    show('raw', String(r.raw));
    show('linear', r.linear.toFixed(3) + ' / ' + r.curved.toFixed(3) + ' (' + s.config.curve + ')');
    show('sequence', String(r.sequence));
    show('age', r.ageMs === null ? '-' : String(r.ageMs));
    show('osc', c.pushEnabled ? s.config.osc.address + ' - ' + c.oscSent + ' enviados' : 'desabilitado');
    show('failures', c.sampleFailures + ' / ' + c.pushFailures);
    show('firmware', sys.firmware);
    show('uptime', sys.uptimeText);
    show('heap', sys.freeHeap + ' bytes');
    show('wifi', sys.ipAddress + ' (' + sys.wifiRssi + ' dBm)');
  }

  function poll() {
    fetch('/status').then((res) => res.json()).then(render)
      .catch((err) => console.warn('status indisponível', err))
      .finally(() => setTimeout(poll, 1000));
  }
  poll();
</script>
</body>
</html>)rawliteral";

FaderWebServer::FaderWebServer(uint16_t port, const FaderConfig &config, SharedReading &shared,
                               FaderController &controller, const OscSender *oscSender)
    : m_server(port),
    m_config(config),
    m_shared(shared),
    m_controller(controller),
    m_oscSender(oscSender) {
}

bool FaderWebServer::begin() {
    m_server.on("/", HTTP_GET,
        [this](AsyncWebServerRequest *request) { handleRoot(request); });

    m_server.on("/potentiometer", HTTP_GET,
        [this](AsyncWebServerRequest *request) { handlePotentiometer(request); });

    m_server.on("/health", HTTP_GET,
        [this](AsyncWebServerRequest *request) { handleHealth(request); });

    m_server.on("/status", HTTP_GET,
        [this](AsyncWebServerRequest *request) { handleStatus(request); });

    m_server.on("/logs", HTTP_GET,
        [this](AsyncWebServerRequest *request) { handleLogs(request); });

    // Handler para rotas não encontradas
    m_server.onNotFound(
        [this](AsyncWebServerRequest *request) { handleNotFound(request); });

    m_server.begin();

    LOG_INFO(MODULE_NAME, "Servidor iniciado na porta %u", WEB_SERVER_PORT);

    return true;
}

void FaderWebServer::handleRoot(AsyncWebServerRequest *request) {
    request->send_P(200, "text/html", INDEX_HTML);
}

void FaderWebServer::handlePotentiometer(AsyncWebServerRequest *request) {
    FaderReading reading = m_shared.snapshot();

    StaticJsonDocument<128> doc;
    doc["value"] = reading.rawCount;
    doc["timestamp"] = reading.timestamp;

    String response;
    serializeJson(doc, response);

    request->send(200, "application/json", response);

    if (DEBUG_MODE) {
        LOG_DEBUG(MODULE_NAME, "/potentiometer requisitado por %s",
                  request->client()->remoteIP().toString().c_str());
    }
}

void FaderWebServer::handleHealth(AsyncWebServerRequest *request) {
    request->send(200, "text/plain", "OK");
}

void FaderWebServer::handleStatus(AsyncWebServerRequest *request) {
    FaderTelemetry telemetry = FaderTelemetry::capture(m_shared, m_controller, m_oscSender);

    StaticJsonDocument<JSON_BUFFER_SIZE> doc;
    JsonObject root = doc.to<JsonObject>();
    telemetry.toJson(root, millis());
    appendConfig(root);

    if (doc.overflowed()) {
        LOG_WARN(MODULE_NAME, "Documento de status truncado, aumente JSON_BUFFER_SIZE");
    }

    String response;
    serializeJson(doc, response);

    request->send(200, "application/json", response);
}

void FaderWebServer::appendConfig(JsonObject &json) const {
    JsonObject config = json.createNestedObject("config");

    config["curve"] = SignalConditioner::curveName(m_config.curve);
    config["rawMin"] = m_config.range.min;
    config["rawMax"] = m_config.range.max;
    config["dbMin"] = m_config.decibels.dbMin;
    config["dbMax"] = m_config.decibels.dbMax;
    config["rateLimit"] = m_config.rateLimiter.enabled;
    config["maxRateUp"] = m_config.rateLimiter.maxRateUp;
    config["maxRateDown"] = m_config.rateLimiter.maxRateDown;
    config["intervalMs"] = m_config.sampleIntervalMs;
    config["maxCount"] = m_config.sampler.maxCount;

    JsonObject osc = config.createNestedObject("osc");
    osc["enabled"] = m_config.pushSink.enabled;
    osc["host"] = m_config.pushSink.host;
    osc["port"] = m_config.pushSink.port;
    osc["address"] = m_config.pushSink.address;
}

void FaderWebServer::handleLogs(AsyncWebServerRequest *request) {
    // ?since=<id> devolve apenas o que o cliente ainda não viu
    uint32_t afterId = 0;
    if (request->hasParam("since")) {
        afterId = static_cast<uint32_t>(request->getParam("since")->value().toInt());
    }

    LogEntry *entries = new (std::nothrow) LogEntry[LOG_BUFFER_SIZE];
    if (!entries) {
        LOG_ERROR(MODULE_NAME, "Falha ao alocar memória para os logs");
        request->send(500, "application/json", "{\"error\":\"Memória insuficiente\"}");
        return;
    }

    size_t count = LogHistory::getInstance().copySince(afterId, entries, LOG_BUFFER_SIZE);
    uint32_t lastId = count > 0 ? entries[count - 1].id : afterId;

    String format = request->hasParam("format") ? request->getParam("format")->value() : "json";

    if (format.equalsIgnoreCase("text") || format.equalsIgnoreCase("plain")) {
        String text;
        text.reserve(count * 96);

        char line[LOG_MAX_MESSAGE_SIZE + LOG_MODULE_NAME_MAX_SIZE + 32];
        for (size_t i = 0; i < count; i++) {
            if (formatLogEntry(entries[i], line, sizeof(line)) > 0) {
                text += line;
                text += '\n';
            }
        }

        request->send(200, "text/plain", text);
    } else {
        // As strings apontam para entries, que vive até a serialização
        DynamicJsonDocument doc(JSON_OBJECT_SIZE(2) + JSON_ARRAY_SIZE(LOG_BUFFER_SIZE) +
                                LOG_BUFFER_SIZE * JSON_OBJECT_SIZE(5));
        doc["next"] = lastId;
        JsonArray logs = doc.createNestedArray("logs");

        for (size_t i = 0; i < count; i++) {
            JsonObject item = logs.createNestedObject();
            item["id"] = entries[i].id;
            item["ms"] = entries[i].timestamp;
            item["level"] = logLevelName(entries[i].level);
            item["module"] = static_cast<const char*>(entries[i].module);
            item["message"] = static_cast<const char*>(entries[i].message);
        }

        String response;
        serializeJson(doc, response);
        request->send(200, "application/json", response);
    }

    delete[] entries;
}

void FaderWebServer::handleNotFound(AsyncWebServerRequest *request) {
    request->send(404, "text/plain", "Página não encontrada");

    if (DEBUG_MODE) {
        LOG_DEBUG(MODULE_NAME, "404 - %s (IP: %s)", request->url().c_str(),
                  request->client()->remoteIP().toString().c_str());
    }
}
