/**
 * @file OscMessage.h
 * @brief Codificação de mensagens OSC 1.0 com um argumento float32.
 */

#ifndef OSC_MESSAGE_H
#define OSC_MESSAGE_H

#include <stddef.h>
#include <stdint.h>

namespace OscMessage {

/**
 * @brief Calcula o tamanho da mensagem codificada.
 *
 * @param address Endereço OSC (ex: "/ch/01/mix/fader")
 * @return Tamanho em bytes, ou 0 se o endereço for inválido
 */
size_t encodedSize(const char* address);

/**
 * @brief Codifica uma mensagem OSC com um único argumento float32.
 *
 * Layout: endereço terminado em nulo e alinhado a 4 bytes, type tag ",f"
 * alinhada a 4 bytes e o valor IEEE-754 em big-endian.
 *
 * @param address Endereço OSC, deve começar com '/'
 * @param value Valor do argumento
 * @param buffer Buffer de saída
 * @param size Tamanho do buffer
 * @return Bytes escritos, 0 se o buffer for pequeno demais ou o endereço inválido
 */
size_t encodeFloat(const char* address, float value, uint8_t* buffer, size_t size);

} // namespace OscMessage

#endif // OSC_MESSAGE_H
