/**
 * @file constants.hpp
 * @brief Константы протокола proof-of-access
 *
 * Размеры полей являются частью контракта и должны совпадать
 * у прувера и верификатора байт в байт.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace segproof::constants {

// =============================================================================
// Размеры полей доказательства
// =============================================================================

/// @brief Размер challenge в байтах
inline constexpr std::size_t CHALLENGE_SIZE = 32;

/// @brief Размер nonce в байтах
inline constexpr std::size_t NONCE_SIZE = 8;

/// @brief Размер digest в байтах
inline constexpr std::size_t DIGEST_SIZE = 16;

/// @brief Максимальная сложность (число бит digest)
inline constexpr uint32_t MAX_DIFFICULTY = DIGEST_SIZE * 8;

/// @brief Размер сегмента данных по умолчанию
inline constexpr std::size_t DEFAULT_SEGMENT_SIZE = 128;

// =============================================================================
// Головоломка (EquiX)
// =============================================================================

/// @brief Количество индексов в решении
inline constexpr std::size_t PUZZLE_INDEX_COUNT = 8;

/// @brief Размер решения в байтах (индексы по 16 бит)
inline constexpr std::size_t SOLUTION_SIZE = PUZZLE_INDEX_COUNT * sizeof(uint16_t);
static_assert(SOLUTION_SIZE == 16, "Решение EquiX занимает 16 байт");

/// @brief Максимум решений на один seed (EQUIX_MAX_SOLS)
inline constexpr std::size_t MAX_SOLUTIONS_PER_SEED = 8;

// =============================================================================
// Сериализация
// =============================================================================

/// @brief Размер записи решения: digest[16] + nonce[8] + solution[16]
inline constexpr std::size_t SOLUTION_RECORD_SIZE = DIGEST_SIZE + NONCE_SIZE + SOLUTION_SIZE;
static_assert(SOLUTION_RECORD_SIZE == 40, "Размер записи решения должен быть 40 байт");

// =============================================================================
// Keccak
// =============================================================================

/// @brief Rate Keccak-256 в байтах (1600 - 2*256 бит)
inline constexpr std::size_t KECCAK256_RATE = 136;

/// @brief Размер вывода Keccak-256
inline constexpr std::size_t KECCAK256_SIZE = 32;

// =============================================================================
// Майнинг
// =============================================================================

/// @brief Целевая сложность по умолчанию (ведущие нулевые биты)
inline constexpr uint32_t DEFAULT_TARGET_DIFFICULTY = 8;

/// @brief Максимальное количество потоков майнинга
inline constexpr std::size_t MAX_WORKERS = 256;

} // namespace segproof::constants
