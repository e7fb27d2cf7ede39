/**
 * @file config.hpp
 * @brief Конфигурация segproof
 * 
 * Загрузка и парсинг конфигурации из TOML файла.
 * 
 * Пример конфигурации (segproof.toml):
 * @code
 * [proof]
 * segment_size = 128
 * selection = "lowest_digest"
 * 
 * [puzzle]
 * compile = true
 * huge_pages = false
 * 
 * [mining]
 * target_difficulty = 8
 * workers = 4
 * start_nonce = 0
 * max_attempts = 0
 * strategy = "interleaved"
 * 
 * [job]
 * challenge = "00112233...eeff"
 * segment_path = "/var/lib/segproof/segment.bin"
 * 
 * [logging]
 * level = "info"
 * refresh_interval_ms = 1000
 * event_history = 200
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "../log/status_reporter.hpp"

#include <string>
#include <filesystem>
#include <optional>

namespace segproof {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Параметры доказательства
 */
struct ProofConfig {
    /// @brief Размер сегмента данных в байтах
    std::size_t segment_size = constants::DEFAULT_SEGMENT_SIZE;
    
    /// @brief Политика выбора решения: "lowest_digest" или "first_found"
    std::string selection = "lowest_digest";
};

/**
 * @brief Настройки решателя головоломки
 */
struct PuzzleConfig {
    /// @brief Компилировать программу хеш-функции (JIT), если доступно
    bool compile = true;
    
    /// @brief Использовать huge pages для арены
    bool huge_pages = false;
};

/**
 * @brief Настройки майнинга
 */
struct MiningConfig {
    /// @brief Целевая сложность (ведущие нулевые биты digest)
    uint32_t target_difficulty = constants::DEFAULT_TARGET_DIFFICULTY;
    
    /// @brief Количество потоков
    uint32_t workers = 1;
    
    /// @brief Первый перебираемый nonce
    uint64_t start_nonce = 0;
    
    /// @brief Лимит попыток (0 = без лимита)
    uint64_t max_attempts = 0;
    
    /// @brief Стратегия распределения nonce: "sequential" или "interleaved"
    std::string strategy = "interleaved";
};

/**
 * @brief Задание: challenge и источник сегмента
 */
struct JobConfig {
    /// @brief Challenge в hex (64 символа), может задаваться из CLI
    std::string challenge;
    
    /// @brief Путь к файлу сегмента данных
    std::string segment_path;
    
    /**
     * @brief Разобрать challenge из hex
     * 
     * @return Challenge или ошибка ConfigInvalidValue
     */
    [[nodiscard]] Result<Challenge> parse_challenge() const;
};

/**
 * @brief Полная конфигурация segproof
 */
struct Config {
    ProofConfig proof;
    PuzzleConfig puzzle;
    MiningConfig mining;
    JobConfig job;
    log::LoggingConfig logging;
    
    /**
     * @brief Загрузить конфигурацию из TOML файла
     * 
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);
    
    /**
     * @brief Загрузить конфигурацию с поиском файла
     * 
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./segproof.toml
     * 3. /etc/segproof/segproof.toml
     * 4. ~/.config/segproof/segproof.toml
     * 
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );
    
    /**
     * @brief Валидация конфигурации
     * 
     * Проверяет корректность всех значений:
     * - Размер сегмента и диапазоны числовых значений
     * - Известные имена политик и стратегий
     * - Формат challenge, если он задан
     * 
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace segproof
