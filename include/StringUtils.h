/**
 * @file StringUtils.h
 * @brief Utilitários otimizados para manipulação de strings.
 */

#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

namespace StringUtils {

/**
 * @brief Copia uma string de forma segura e otimizada.
 *
 * Esta função copia uma string para um buffer de destino com tamanho fixo,
 * garantindo a terminação nula mesmo em casos de truncamento.
 *
 * @param dest Buffer de destino
 * @param src String de origem
 * @param destSize Tamanho total do buffer de destino (incluindo espaço para \0)
 */
inline void safeCopyString(char* dest, const char* src, size_t destSize) {
    if (!dest || !src || destSize == 0) return;

    // Determina o tamanho a ser copiado
    size_t maxLen = destSize - 1;
    size_t srcLen = strlen(src);
    size_t copyLen = (srcLen < maxLen) ? srcLen : maxLen;

    // Copia os bytes e adiciona terminador nulo
    memcpy(dest, src, copyLen);
    dest[copyLen] = '\0';
}

/**
 * @brief Formata um tempo de atividade como "1d 02h 03m 04s".
 *
 * Dias e horas são omitidos enquanto forem zero.
 *
 * @param buffer Buffer de destino
 * @param size Tamanho do buffer
 * @param totalSeconds Tempo em segundos
 * @return Ponteiro para o buffer
 */
inline char* formatUptime(char* buffer, size_t size, uint32_t totalSeconds) {
    if (!buffer || size == 0) return buffer;

    uint32_t days = totalSeconds / 86400;
    uint32_t hours = (totalSeconds % 86400) / 3600;
    uint32_t minutes = (totalSeconds % 3600) / 60;
    uint32_t seconds = totalSeconds % 60;

    if (days > 0) {
        snprintf(buffer, size, "%ud %02uh %02um %02us",
                 (unsigned)days, (unsigned)hours, (unsigned)minutes, (unsigned)seconds);
    } else if (hours > 0) {
        snprintf(buffer, size, "%uh %02um %02us",
                 (unsigned)hours, (unsigned)minutes, (unsigned)seconds);
    } else {
        snprintf(buffer, size, "%um %02us", (unsigned)minutes, (unsigned)seconds);
    }

    return buffer;
}

} // namespace StringUtils

#endif // STRING_UTILS_H
