/**
 * @file OscMessage.cpp
 * @brief Implementação da codificação OSC.
 */

#include "OscMessage.h"
#include <string.h>

namespace {

// Arredonda para o próximo múltiplo de 4 (alinhamento OSC)
inline size_t pad4(size_t length) {
    return (length + 3) & ~static_cast<size_t>(3);
}

inline void packUInt32BE(uint8_t* dest, uint32_t value) {
    dest[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    dest[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    dest[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    dest[3] = static_cast<uint8_t>(value & 0xFF);
}

const char TYPE_TAG_FLOAT[] = ",f";

} // namespace

namespace OscMessage {

size_t encodedSize(const char* address) {
    if (!address || address[0] != '/') {
        return 0;
    }

    return pad4(strlen(address) + 1) + pad4(sizeof(TYPE_TAG_FLOAT)) + sizeof(uint32_t);
}

size_t encodeFloat(const char* address, float value, uint8_t* buffer, size_t size) {
    size_t total = encodedSize(address);
    if (total == 0 || !buffer || size < total) {
        return 0;
    }

    memset(buffer, 0, total);

    size_t offset = 0;
    size_t addressLen = strlen(address);
    memcpy(buffer, address, addressLen);
    offset += pad4(addressLen + 1);

    memcpy(buffer + offset, TYPE_TAG_FLOAT, sizeof(TYPE_TAG_FLOAT) - 1);
    offset += pad4(sizeof(TYPE_TAG_FLOAT));

    uint32_t bits;
    memcpy(&bits, &value, sizeof(bits));
    packUInt32BE(buffer + offset, bits);
    offset += sizeof(bits);

    return offset;
}

} // namespace OscMessage
