/**
 * @file ConsoleFormat.h
 * @brief Saída serial sincronizada: linhas de log, banners e linha de status.
 */

#ifndef CONSOLE_FORMAT_H
#define CONSOLE_FORMAT_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Número máximo de padrões de supressão
#define CONSOLE_MAX_FILTERS       4

/**
 * @class ConsoleManager
 * @brief Serializa a escrita na Serial entre as tarefas.
 *
 * Mantém no máximo uma linha de status "viva" (reescrita com \r) abaixo
 * dos logs; qualquer linha normal encerra a linha de status antes.
 */
class ConsoleManager {
public:
    static ConsoleManager& getInstance();

    /**
     * @brief Registra um trecho de texto cuja presença suprime a linha.
     *
     * Usado para ruído conhecido (ex: avisos do watchdog repassados).
     *
     * @param pattern Trecho a suprimir (deve ter duração estática).
     * @return false se a tabela de filtros estiver cheia.
     */
    bool addFilter(const char* pattern);

    /**
     * @brief Escreve uma linha completa.
     *
     * @param text Texto já formatado.
     * @param critical Se true, ignora os filtros.
     */
    void writeLine(const char* text, bool critical = false);

    /**
     * @brief Reescreve a linha de status no lugar.
     * @param text Texto já formatado.
     */
    void status(const char* text);

    /**
     * @brief Abre um bloco com título entre divisores.
     * @param title Título do bloco.
     */
    void banner(const char* title);

    /**
     * @brief Fecha o bloco aberto por banner().
     */
    void closeBanner();

    /**
     * @brief Descarta o que estiver pendente e separa a saída do boot.
     */
    void reset();

private:
    ConsoleManager();

    ConsoleManager(const ConsoleManager&) = delete;
    ConsoleManager& operator=(const ConsoleManager&) = delete;

    bool lock(uint32_t timeoutMs);
    void unlock();
    bool isFiltered(const char* text) const;
    void breakStatusLine();

    SemaphoreHandle_t m_mutex;
    const char* m_filters[CONSOLE_MAX_FILTERS];
    size_t m_filterCount;
    size_t m_statusLength;   ///< Largura da última linha de status (0 = nenhuma ativa)

    static ConsoleManager* s_instance;
};

#define CONSOLE_RESET()              ConsoleManager::getInstance().reset()
#define CONSOLE_BEGIN_SECTION(title) ConsoleManager::getInstance().banner(title)
#define CONSOLE_END_SECTION()        ConsoleManager::getInstance().closeBanner()

#endif // CONSOLE_FORMAT_H
