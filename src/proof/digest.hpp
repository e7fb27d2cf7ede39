/**
 * @file digest.hpp
 * @brief Вычисление digest доказательства
 *
 * digest = Keccak-256(seed || canonical_solution || data)[0..16)
 *
 * Порядок конкатенации - часть контракта. Данные хешируются напрямую,
 * поэтому проверить доказательство может только тот, у кого есть
 * (или кто может независимо получить) сам сегмент.
 */

#pragma once

#include "../core/types.hpp"
#include "canonicalizer.hpp"

namespace segproof::proof {

/**
 * @brief Вычислить digest
 *
 * @param seed Seed головоломки
 * @param solution Каноническое решение
 * @param data Сырые байты сегмента
 * @return Digest Первые 16 байт Keccak-256
 */
[[nodiscard]] Digest compute_digest(
    ByteSpan seed,
    const CanonicalSolution& solution,
    ByteSpan data
) noexcept;

/**
 * @brief Сравнить два digest за постоянное время
 */
[[nodiscard]] bool digests_equal(const Digest& a, const Digest& b) noexcept;

} // namespace segproof::proof
