/**
 * @file OscSender.cpp
 * @brief Implementação do envio OSC.
 */

#include "OscSender.h"
#include "LogSystem.h"
#include "OscMessage.h"
#include "SystemMonitor.h"
#include "WiFiManager.h"

#define MODULE_NAME "OscSender"

OscSender::OscSender(const PushSinkConfig& config)
    : m_config(config),
    m_target(OSC_RESOLVE_RETRY_MS),
    m_started(false),
    m_sentCount(0) {
}

bool OscSender::begin() {
    if (OscMessage::encodedSize(m_config.address) == 0) {
        LOG_ERROR(MODULE_NAME, "Endereço OSC inválido: '%s'", m_config.address);
        return false;
    }

    if (OscMessage::encodedSize(m_config.address) > OSC_PACKET_MAX_SIZE) {
        LOG_ERROR(MODULE_NAME, "Endereço OSC longo demais: '%s'", m_config.address);
        return false;
    }

    if (!m_udp.begin(m_config.localPort)) {
        LOG_ERROR(MODULE_NAME, "Não foi possível abrir a porta UDP local %u", m_config.localPort);
        return false;
    }
    m_started = true;

    // Endereço IP literal dispensa DNS
    IPAddress literal;
    if (literal.fromString(m_config.host)) {
        m_target.setLiteral(uint32_t(literal));
        LOG_INFO(MODULE_NAME, "Destino OSC %s:%u (%s)", literal.toString().c_str(),
                 m_config.port, m_config.address);
    } else {
        LOG_INFO(MODULE_NAME, "Destino '%s' será resolvido pela tarefa de serviços",
                 m_config.host);
    }

    return true;
}

void OscSender::refreshTarget() {
    if (!m_started) {
        return;
    }

    WiFiManager &wifi = WiFiManager::getInstance();
    if (!wifi.isConnected()) {
        return;
    }

    uint32_t generation = wifi.getLinkGeneration();
    uint32_t now = millis();
    if (!m_target.shouldResolve(generation, now)) {
        return;
    }

    // A consulta pode levar segundos
    SystemMonitor::getInstance().feed();

    IPAddress address;
    if (WiFi.hostByName(m_config.host, address) == 1 && uint32_t(address) != 0) {
        if (m_target.publish(uint32_t(address), generation)) {
            LOG_INFO(MODULE_NAME, "Host '%s' resolvido para %s", m_config.host,
                     address.toString().c_str());
        }
    } else {
        m_target.recordFailure(generation, millis());
        LOG_WARN(MODULE_NAME, "Falha ao resolver '%s', nova tentativa em %lu ms",
                 m_config.host, (unsigned long)OSC_RESOLVE_RETRY_MS);
    }
}

bool OscSender::send(float value) {
    if (!m_started || !WiFiManager::getInstance().isConnected()) {
        return false;
    }

    uint32_t target;
    if (!m_target.get(target)) {
        return false;
    }

    uint8_t packet[OSC_PACKET_MAX_SIZE];
    size_t length = OscMessage::encodeFloat(m_config.address, value, packet, sizeof(packet));
    if (length == 0) {
        return false;
    }

    if (!m_udp.beginPacket(IPAddress(target), m_config.port)) {
        return false;
    }

    if (m_udp.write(packet, length) != length) {
        m_udp.endPacket();
        return false;
    }

    if (!m_udp.endPacket()) {
        return false;
    }

    m_sentCount++;
    return true;
}
