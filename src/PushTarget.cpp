/**
 * @file PushTarget.cpp
 * @brief Implementação do endereço de destino do envio.
 */

#include "PushTarget.h"

PushTarget::PushTarget(uint32_t retryMs)
    : m_address(0),
    m_literal(false),
    m_resolved(false),
    m_resolvedGeneration(0),
    m_failed(false),
    m_failedGeneration(0),
    m_lastFailureMs(0),
    m_retryMs(retryMs) {
}

void PushTarget::setLiteral(uint32_t address) {
    m_address = address;
    m_literal = true;
}

bool PushTarget::shouldResolve(uint32_t linkGeneration, uint32_t nowMs) const {
    if (m_literal) {
        return false;
    }

    if (m_resolved && m_resolvedGeneration == linkGeneration) {
        return false;
    }

    // Falhas na mesma geração esperam o intervalo de nova tentativa
    if (m_failed && m_failedGeneration == linkGeneration) {
        return nowMs - m_lastFailureMs >= m_retryMs;
    }

    return true;
}

bool PushTarget::publish(uint32_t address, uint32_t linkGeneration) {
    uint32_t previous = m_address.exchange(address);

    m_resolved = true;
    m_resolvedGeneration = linkGeneration;
    m_failed = false;

    return previous != address;
}

void PushTarget::recordFailure(uint32_t linkGeneration, uint32_t nowMs) {
    m_failed = true;
    m_failedGeneration = linkGeneration;
    m_lastFailureMs = nowMs;
}

bool PushTarget::get(uint32_t &address) const {
    uint32_t current = m_address.load();
    if (current == 0) {
        return false;
    }

    address = current;
    return true;
}
