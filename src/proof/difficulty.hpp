/**
 * @file difficulty.hpp
 * @brief Оценка сложности digest
 *
 * Сложность - количество ведущих нулевых бит digest, прочитанного как
 * big-endian число. Чем меньше digest, тем выше сложность. Равные
 * значения разрешает вызывающий протокол, а не это ядро.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>

namespace segproof::proof {

/**
 * @brief Количество ведущих нулевых бит
 *
 * @param digest Digest доказательства
 * @return uint32_t От 0 (первый байт >= 0x80) до 128 (все нули)
 */
[[nodiscard]] uint32_t difficulty(const Digest& digest) noexcept;

/**
 * @brief Проверить, достигает ли digest требуемой сложности
 */
[[nodiscard]] bool meets_difficulty(const Digest& digest, uint32_t min_difficulty) noexcept;

/**
 * @brief Строго ли digest a лучше (меньше как big-endian число), чем b
 */
[[nodiscard]] bool is_better_digest(const Digest& a, const Digest& b) noexcept;

} // namespace segproof::proof
