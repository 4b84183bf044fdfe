/**
 * @file FaderTelemetry.cpp
 * @brief Implementação da serialização do estado do fader.
 */

#include "FaderTelemetry.h"
#include "LogSystem.h"
#include "StringUtils.h"
#include "SystemMonitor.h"
#include "WiFiManager.h"

FaderTelemetry::FaderTelemetry()
    : pushEnabled(false),
      oscSent(0),
      wifiRssi(0),
      logWarnings(0),
      logErrors(0) {
    memset(ipAddress, 0, sizeof(ipAddress));
}

FaderTelemetry FaderTelemetry::capture(const SharedReading& shared, const FaderController& controller,
                                       const OscSender* oscSender) {
    FaderTelemetry telemetry;

    telemetry.reading = shared.snapshot();
    telemetry.cycles = controller.getStats();
    telemetry.system = SystemMonitor::getInstance().getStats();
    telemetry.pushEnabled = controller.isPushEnabled();
    telemetry.oscSent = oscSender ? oscSender->getSentCount() : 0;

    WiFiManager& wifi = WiFiManager::getInstance();
    telemetry.wifiRssi = wifi.getRSSI();
    wifi.getIPString(telemetry.ipAddress, sizeof(telemetry.ipAddress));

    LogRouter& router = LogRouter::getInstance();
    telemetry.logWarnings = router.getCount(LogLevel::WARN);
    telemetry.logErrors = router.getCount(LogLevel::ERROR) + router.getCount(LogLevel::FATAL);

    return telemetry;
}

void FaderTelemetry::toJson(JsonObject& json, uint32_t nowMs) const {
    JsonObject fader = json.createNestedObject("reading");
    fader["raw"] = reading.rawCount;
    fader["linear"] = reading.linear;
    fader["curved"] = reading.curved;
    fader["output"] = reading.output;
    fader["db"] = reading.decibels;
    fader["timestamp"] = reading.timestamp;
    fader["sequence"] = reading.sequence;
    // Sem leitura publicada ainda, a idade não faz sentido
    if (reading.sequence > 0) {
        fader["ageMs"] = nowMs - reading.capturedAtMs;
    } else {
        fader["ageMs"] = nullptr;
    }

    JsonObject controller = json.createNestedObject("controller");
    controller["cycles"] = cycles.cycles;
    controller["sampleFailures"] = cycles.sampleFailures;
    controller["pushFailures"] = cycles.pushFailures;
    controller["pushEnabled"] = pushEnabled;
    controller["oscSent"] = oscSent;

    char uptimeText[24];
    JsonObject stats = json.createNestedObject("system");
    stats["firmware"] = FIRMWARE_VERSION;
    stats["uptime"] = system.uptime;
    stats["uptimeText"] = StringUtils::formatUptime(uptimeText, sizeof(uptimeText), system.uptime);
    stats["freeHeap"] = system.freeHeap;
    stats["minFreeHeap"] = system.minFreeHeap;
    stats["fragmentation"] = system.heapFragmentation;
    stats["minStackFree"] = system.minStackFree;
    stats["wifiRssi"] = wifiRssi;
    stats["ipAddress"] = ipAddress;

    JsonObject logStats = json.createNestedObject("log");
    logStats["warnings"] = logWarnings;
    logStats["errors"] = logErrors;
}

char* FaderTelemetry::toConsoleString(char* buffer, size_t bufferSize) const {
    char uptimeText[24];
    StringUtils::formatUptime(uptimeText, sizeof(uptimeText), system.uptime);

    snprintf(buffer, bufferSize,
        "Fader → raw: %-7u saída: %5.3f (%6.1f dB) | falhas: %u/%u | Up: %s | Heap: %u",
        (unsigned)reading.rawCount, reading.output, reading.decibels,
        (unsigned)cycles.sampleFailures, (unsigned)cycles.pushFailures,
        uptimeText, (unsigned)system.freeHeap);

    return buffer;
}
