/**
 * @file canonicalizer.hpp
 * @brief Каноническая форма решения головоломки
 *
 * Решение EquiX - листья бинарного дерева глубины 3. Перестановка двух
 * половин любого выровненного блока (размера 2, 4 или 8) не влияет на
 * валидность. Без канонизации прувер мог бы перебирать эквивалентные
 * перестановки одного решения в поисках меньшего digest, не выполняя
 * дополнительной работы.
 *
 * Порядок: снизу вверх по уровням дерева, соседние блоки упорядочиваются
 * лексикографически по числовым значениям индексов (равные блоки остаются
 * на месте). Результат - лексикографически минимальный элемент орбиты,
 * поэтому разные классы эквивалентности не совпадают.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../puzzle/puzzle_solver.hpp"

#include <array>

namespace segproof::proof {

/**
 * @brief Байтовое представление решения (индексы в little-endian)
 */
using SolutionBytes = std::array<uint8_t, constants::SOLUTION_SIZE>;

/**
 * @brief Решение в канонической форме
 *
 * Создаётся только через canonicalize(), поэтому хешируется
 * всегда каноническая форма.
 */
class CanonicalSolution {
public:
    /// @brief Нулевое решение (канонично)
    CanonicalSolution() = default;

    /**
     * @brief Индексы в каноническом порядке
     */
    [[nodiscard]] const puzzle::RawSolution& indices() const noexcept { return indices_; }

    /**
     * @brief Закодировать в 16 байт (каждый индекс little-endian)
     */
    [[nodiscard]] SolutionBytes to_bytes() const noexcept;

    [[nodiscard]] bool operator==(const CanonicalSolution& other) const noexcept = default;

private:
    explicit CanonicalSolution(const puzzle::RawSolution& indices) noexcept
        : indices_(indices) {}

    friend CanonicalSolution canonicalize(const puzzle::RawSolution& raw) noexcept;

    puzzle::RawSolution indices_{};
};

/**
 * @brief Привести решение к канонической форме
 *
 * Тотальная чистая функция.
 */
[[nodiscard]] CanonicalSolution canonicalize(const puzzle::RawSolution& raw) noexcept;

/**
 * @brief Проверить, находится ли решение уже в канонической форме
 */
[[nodiscard]] bool is_canonical(const puzzle::RawSolution& raw) noexcept;

/**
 * @brief Закодировать сырое решение в байты (без канонизации)
 */
[[nodiscard]] SolutionBytes encode_solution(const puzzle::RawSolution& raw) noexcept;

/**
 * @brief Декодировать решение из байт
 *
 * @param bytes 16 байт, индексы в little-endian
 * @return Result<RawSolution> Решение или InvalidSolution при неверной длине
 */
[[nodiscard]] Result<puzzle::RawSolution> decode_solution(ByteSpan bytes);

} // namespace segproof::proof
