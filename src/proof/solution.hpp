/**
 * @file solution.hpp
 * @brief Результат solve: nonce, digest и каноническое решение
 *
 * Формат записи (40 байт):
 * @code
 * digest[16] || nonce[8] || solution[16]
 * @endcode
 * Решение в записи всегда в канонической форме; запись с
 * неканоническим решением отклоняется при декодировании.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "canonicalizer.hpp"

#include <array>
#include <cstdint>

namespace segproof::proof {

/**
 * @brief Сериализованное решение
 */
using SolutionRecord = std::array<uint8_t, constants::SOLUTION_RECORD_SIZE>;

/**
 * @brief Доказательство, полученное из solve
 *
 * Значение без собственного жизненного цикла: создаётся solve,
 * потребляется verify или логикой сравнения сложности.
 */
struct Solution {
    /// @brief Nonce, с которым получено решение
    Nonce nonce{};

    /// @brief Digest (16 байт)
    Digest digest{};

    /// @brief Каноническое решение головоломки
    CanonicalSolution solution;

    /**
     * @brief Сложность digest (ведущие нулевые биты)
     */
    [[nodiscard]] uint32_t difficulty() const noexcept;

    /**
     * @brief Сериализовать в 40 байт
     */
    [[nodiscard]] SolutionRecord to_bytes() const noexcept;

    /**
     * @brief Десериализовать из 40 байт
     *
     * @return Result<Solution> Решение, InvalidRecordLength или
     *         InvalidSolution для неканонического решения
     */
    [[nodiscard]] static Result<Solution> from_bytes(ByteSpan bytes);

    [[nodiscard]] bool operator==(const Solution& other) const noexcept = default;
};

} // namespace segproof::proof
