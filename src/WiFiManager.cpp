/**
 * @file WiFiManager.cpp
 * @brief Implementação do enlace WiFi.
 */

#include "WiFiManager.h"
#include "Hardware.h"
#include "LogSystem.h"

#define MODULE_NAME "WiFi"

// Expoente máximo do backoff: 2s * 2^5 = 64s entre tentativas
#define WIFI_BACKOFF_MAX_EXPONENT 5

WiFiManager *WiFiManager::s_instance = nullptr;

WiFiManager &WiFiManager::getInstance() {
    if (s_instance == nullptr) {
        s_instance = new WiFiManager();
    }
    return *s_instance;
}

WiFiManager::WiFiManager()
    : m_ssid(nullptr),
      m_password(nullptr),
      m_state(LinkState::IDLE),
      m_hasIp(false),
      m_generation(0),
      m_attempts(0),
      m_nextAttemptMs(0),
      m_ip(0),
      m_rssiMutex(xSemaphoreCreateMutex()),
      m_rssi(0),
      m_rssiReadMs(0) {
}

void WiFiManager::onWiFiEvent(WiFiEvent_t event, WiFiEventInfo_t info) {
    WiFiManager &self = getInstance();

    if (event == ARDUINO_EVENT_WIFI_STA_GOT_IP) {
        // O DHCP pode entregar outro IP sem passar por update()
        self.m_ip = info.got_ip.ip_info.ip.addr;
        self.m_hasIp = true;
        Hardware::setLedState(Hardware::LED_ON);
    } else if (event == ARDUINO_EVENT_WIFI_STA_DISCONNECTED ||
               event == ARDUINO_EVENT_WIFI_STA_LOST_IP) {
        self.m_hasIp = false;
        Hardware::setLedState(Hardware::LED_OFF);
    }
}

bool WiFiManager::connect(const char *ssid, const char *password) {
    if (!ssid || ssid[0] == '\0') {
        LOG_ERROR(MODULE_NAME, "SSID não configurado");
        return false;
    }

    m_ssid = ssid;
    m_password = password;

    WiFi.mode(WIFI_STA);
    // Sem economia de energia: latência estável para os datagramas OSC
    WiFi.setSleep(false);
    WiFi.onEvent(onWiFiEvent);

    LOG_INFO(MODULE_NAME, "Associando à rede '%s'", ssid);
    m_attempts = 0;
    startAttempt(millis());
    return true;
}

bool WiFiManager::waitForConnection(uint32_t timeoutMs) {
    uint32_t start = millis();

    while (WiFi.status() != WL_CONNECTED) {
        if (millis() - start >= timeoutMs) {
            LOG_WARN(MODULE_NAME, "Sem IP após %lu ms, inicialização segue sem rede",
                     (unsigned long)timeoutMs);
            return false;
        }
        Hardware::toggleLed();
        delay(250);
    }

    markConnected(false);
    return true;
}

void WiFiManager::startAttempt(uint32_t nowMs) {
    m_attempts++;
    m_state = LinkState::CONNECTING;
    scheduleRetry(nowMs);

    WiFi.disconnect();
    WiFi.begin(m_ssid, m_password);
}

void WiFiManager::scheduleRetry(uint32_t nowMs) {
    unsigned int exponent = m_attempts > 0 ? m_attempts - 1 : 0;
    if (exponent > WIFI_BACKOFF_MAX_EXPONENT) {
        exponent = WIFI_BACKOFF_MAX_EXPONENT;
    }
    m_nextAttemptMs = nowMs + WIFI_RECONNECT_INTERVAL * (1UL << exponent);
}

void WiFiManager::markConnected(bool recovered) {
    m_ip = uint32_t(WiFi.localIP());
    m_hasIp = true;
    m_state = LinkState::CONNECTED;
    m_attempts = 0;
    m_generation++;
    Hardware::setLedState(Hardware::LED_ON);

    char ip[16];
    LOG_INFO(MODULE_NAME, "%s - IP %s, RSSI %d dBm",
             recovered ? "Conexão restabelecida" : "Conectado",
             getIPString(ip, sizeof(ip)), WiFi.RSSI());
}

bool WiFiManager::update() {
    if (m_state == LinkState::IDLE) {
        return false;
    }

    uint32_t now = millis();
    bool linkUp = WiFi.status() == WL_CONNECTED;

    switch (m_state) {
        case LinkState::CONNECTED:
            if (linkUp) {
                return true;
            }
            LOG_WARN(MODULE_NAME, "Conexão perdida");
            m_hasIp = false;
            m_attempts = 0;
            startAttempt(now);
            return false;

        case LinkState::CONNECTING:
            if (linkUp) {
                markConnected(true);
                return true;
            }
            if ((int32_t)(now - m_nextAttemptMs) < 0) {
                return false;
            }
            if (m_attempts >= WIFI_MAX_RECONNECT_ATTEMPTS) {
                LOG_ERROR(MODULE_NAME, "%u tentativas sem sucesso, pausa de %lu s",
                          m_attempts, (unsigned long)(WIFI_RECOVERY_COOLDOWN / 1000));
                WiFi.disconnect();
                m_state = LinkState::COOLDOWN;
                m_nextAttemptMs = now + WIFI_RECOVERY_COOLDOWN;
                return false;
            }
            startAttempt(now);
            LOG_INFO(MODULE_NAME, "Tentativa %u/%u, próxima em %lu ms", m_attempts,
                     WIFI_MAX_RECONNECT_ATTEMPTS, (unsigned long)(m_nextAttemptMs - now));
            Hardware::toggleLed();
            return false;

        case LinkState::COOLDOWN:
            if ((int32_t)(now - m_nextAttemptMs) >= 0) {
                LOG_INFO(MODULE_NAME, "Retomando tentativas de conexão");
                m_attempts = 0;
                startAttempt(now);
            }
            return false;

        default:
            return false;
    }
}

char *WiFiManager::getIPString(char *buffer, size_t size) const {
    if (!buffer || size == 0) {
        return buffer;
    }

    if (m_hasIp) {
        IPAddress ip(m_ip.load());
        snprintf(buffer, size, "%u.%u.%u.%u", ip[0], ip[1], ip[2], ip[3]);
    } else {
        snprintf(buffer, size, "0.0.0.0");
    }
    return buffer;
}

int16_t WiFiManager::getRSSI() {
    if (!m_hasIp) {
        return 0;
    }

    if (!m_rssiMutex || xSemaphoreTake(m_rssiMutex, pdMS_TO_TICKS(50)) != pdTRUE) {
        return WiFi.RSSI();
    }

    uint32_t now = millis();
    if (m_rssi == 0 || now - m_rssiReadMs >= 1000) {
        m_rssi = WiFi.RSSI();
        m_rssiReadMs = now;
    }
    int16_t rssi = m_rssi;
    xSemaphoreGive(m_rssiMutex);
    return rssi;
}
