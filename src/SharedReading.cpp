/**
 * @file SharedReading.cpp
 * @brief Implementação da célula de leitura compartilhada.
 */

#include "SharedReading.h"

SharedReading::SharedReading() {
}

void SharedReading::publish(const FaderReading &reading) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reading = reading;
}

FaderReading SharedReading::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reading;
}
