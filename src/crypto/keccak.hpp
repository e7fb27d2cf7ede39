/**
 * @file keccak.hpp
 * @brief Keccak-256 интерфейс
 *
 * Оригинальный Keccak-256 (padding 0x01, до стандартизации FIPS 202),
 * тот же вариант, что используется в Ethereum и Solana.
 *
 * Используется для вычисления digest доказательства:
 * digest = Keccak-256(seed || canonical_solution || data)[0..16)
 *
 * @note Не путать с SHA3-256: отличается только байт domain separator
 *       (0x06 у SHA3), но результаты несовместимы.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <initializer_list>

namespace segproof::crypto {

// =============================================================================
// Типы данных
// =============================================================================

/**
 * @brief Состояние Keccak-f[1600] (25 x 64-bit слов)
 */
using KeccakState = std::array<uint64_t, 25>;

// =============================================================================
// Перестановка
// =============================================================================

/**
 * @brief Перестановка Keccak-f[1600] (24 раунда)
 *
 * @param state Состояние (будет модифицировано)
 */
void keccak_f1600(KeccakState& state) noexcept;

// =============================================================================
// Потоковый хешер
// =============================================================================

/**
 * @brief Потоковый Keccak-256
 *
 * Позволяет хешировать конкатенацию нескольких буферов без
 * промежуточного копирования.
 *
 * @code
 * crypto::Keccak256 hasher;
 * hasher.update(seed);
 * hasher.update(solution_bytes);
 * hasher.update(data);
 * auto hash = hasher.finalize();
 * @endcode
 */
class Keccak256 {
public:
    Keccak256() noexcept;

    /**
     * @brief Добавить данные
     */
    Keccak256& update(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    void absorb_block(const uint8_t* block) noexcept;

    KeccakState state_{};
    std::array<uint8_t, constants::KECCAK256_RATE> buffer_{};
    std::size_t buffer_len_ = 0;
};

// =============================================================================
// Функции-обёртки
// =============================================================================

/**
 * @brief Вычислить Keccak-256 данных произвольной длины
 *
 * @param data Входные данные
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 keccak256(ByteSpan data) noexcept;

/**
 * @brief Вычислить Keccak-256 конкатенации нескольких буферов
 *
 * keccak256({a, b, c}) == keccak256(a || b || c)
 */
[[nodiscard]] Hash256 keccak256(std::initializer_list<ByteSpan> parts) noexcept;

} // namespace segproof::crypto
