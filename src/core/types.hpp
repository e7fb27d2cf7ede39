/**
 * @file types.hpp
 * @brief Базовые типы для segproof
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Challenge / Nonce / Digest: байтовые значения фиксированной длины
 * - Bytes: динамический массив байт (seed, сегмент данных)
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ошибки в пути solve/verify возвращаются значениями,
 *       исключения не используются.
 */

#pragma once

#include "constants.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace segproof {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Результат Keccak-256 до усечения.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Challenge протокола (32 байта), назначается извне
 */
using Challenge = std::array<uint8_t, constants::CHALLENGE_SIZE>;

/**
 * @brief Nonce (8 байт), выбирается прувером
 */
using Nonce = std::array<uint8_t, constants::NONCE_SIZE>;

/**
 * @brief Итоговый digest доказательства (16 байт)
 */
using Digest = std::array<uint8_t, constants::DIGEST_SIZE>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Seed головоломки: challenge || data || nonce
 *
 * Никогда не сохраняется, всегда вычисляется заново.
 */
using Seed = Bytes;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Изменяемое представление на массив байт
 */
using MutableByteSpan = std::span<uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Позволяет вызывающему циклу майнинга различать три класса отказов:
 * "попробуй другой nonce", "доказательство поддельное" и "ошибка вызывающего".
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Некорректные входные данные (200-299)
    InvalidChallengeLength = 200,
    InvalidDataLength = 201,
    InvalidNonceLength = 202,
    InvalidDigestLength = 203,
    InvalidRecordLength = 204,

    // Ошибки доказательства (300-399)
    NoSolutionFound = 300,
    InvalidSolution = 301,
    DigestMismatch = 302,

    // Ошибки головоломки (400-499)
    PuzzleFailure = 400,
    ArenaBusy = 401,
    ArenaMismatch = 402,

    // Ошибки майнинга (500-599)
    InsufficientDifficulty = 500,
    MiningExhausted = 501,
    MiningStopped = 502,
    MinerBusy = 503,

    // Системные ошибки (800-899)
    SystemOutOfMemory = 800,
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::InvalidChallengeLength: return "Некорректная длина challenge";
        case ErrorCode::InvalidDataLength: return "Некорректная длина сегмента данных";
        case ErrorCode::InvalidNonceLength: return "Некорректная длина nonce";
        case ErrorCode::InvalidDigestLength: return "Некорректная длина digest";
        case ErrorCode::InvalidRecordLength: return "Некорректная длина записи решения";
        case ErrorCode::NoSolutionFound: return "Решение головоломки не найдено";
        case ErrorCode::InvalidSolution: return "Некорректное решение головоломки";
        case ErrorCode::DigestMismatch: return "Digest не совпадает";
        case ErrorCode::PuzzleFailure: return "Ошибка построения головоломки";
        case ErrorCode::ArenaBusy: return "Арена решателя уже используется";
        case ErrorCode::ArenaMismatch: return "Арена не подходит для решателя";
        case ErrorCode::InsufficientDifficulty: return "Сложность ниже требуемой";
        case ErrorCode::MiningExhausted: return "Исчерпан лимит попыток";
        case ErrorCode::MiningStopped: return "Майнинг остановлен";
        case ErrorCode::MinerBusy: return "Майнер уже запущен";
        case ErrorCode::SystemOutOfMemory: return "Недостаточно памяти";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    /**
     * @brief Оператор сравнения (только по коду)
     */
    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * auto seed = binder.bind(challenge, data, nonce);
 * if (!seed) {
 *     std::cerr << seed.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace segproof
