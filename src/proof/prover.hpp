/**
 * @file prover.hpp
 * @brief Операции solve и verify доказательства доступа к данным
 *
 * solve:  bind -> generate -> canonicalize -> digest -> select
 * verify: bind -> canonicalize -> validate -> digest -> compare
 *
 * Обе операции синхронные и не имеют разделяемого изменяемого состояния:
 * один Prover можно использовать из нескольких потоков, если каждый
 * поток передаёт в solve свою арену.
 */

#pragma once

#include "../core/types.hpp"
#include "../puzzle/puzzle_solver.hpp"
#include "challenge_binder.hpp"
#include "solution.hpp"

#include <optional>
#include <string_view>

namespace segproof::proof {

// =============================================================================
// Политика выбора решения
// =============================================================================

/**
 * @brief Какое решение вернуть, если головоломка дала несколько
 */
enum class SelectionPolicy {
    LowestDigest,   ///< Наименьший digest (наибольшая сложность)
    FirstFound      ///< Первое в порядке решателя
};

/**
 * @brief Преобразовать политику в строку
 */
[[nodiscard]] constexpr std::string_view to_string(SelectionPolicy policy) noexcept {
    switch (policy) {
        case SelectionPolicy::LowestDigest: return "lowest_digest";
        case SelectionPolicy::FirstFound:   return "first_found";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать политику из строки
 *
 * @return Политика или nullopt для неизвестной строки
 */
[[nodiscard]] std::optional<SelectionPolicy> selection_from_string(std::string_view str) noexcept;

// =============================================================================
// Prover
// =============================================================================

/**
 * @brief Оркестратор solve/verify
 */
class Prover {
public:
    /**
     * @brief Создать прувер
     *
     * @param solver Головоломка (должна жить дольше прувера)
     * @param params Параметры протокола
     * @param policy Политика выбора среди нескольких решений
     */
    Prover(
        const puzzle::PuzzleSolver& solver,
        const ProofParams& params,
        SelectionPolicy policy = SelectionPolicy::LowestDigest
    );

    /**
     * @brief Построить доказательство, используя арену вызывающего
     *
     * @param challenge Challenge (32 байта)
     * @param data Сегмент данных (segment_size байт)
     * @param nonce Nonce (8 байт)
     * @param arena Арена решателя (на время вызова арендуется эксклюзивно)
     * @return Result<Solution> Решение или ошибка:
     *         - Invalid*Length: некорректные аргументы
     *         - ArenaBusy: арена занята другим вызовом
     *         - NoSolutionFound: нужно попробовать другой nonce
     *         - PuzzleFailure / ArenaMismatch: ошибка решателя
     */
    [[nodiscard]] Result<Solution> solve(
        ByteSpan challenge,
        ByteSpan data,
        ByteSpan nonce,
        puzzle::SolverArena& arena
    ) const;

    /**
     * @brief Построить доказательство со временной ареной
     *
     * Удобно для единичных вызовов; в цикле майнинга используйте
     * перегрузку с ареной.
     */
    [[nodiscard]] Result<Solution> solve(
        ByteSpan challenge,
        ByteSpan data,
        ByteSpan nonce
    ) const;

    /**
     * @brief Проверить доказательство
     *
     * @param challenge Challenge (32 байта)
     * @param data Сегмент данных
     * @param nonce Nonce (8 байт)
     * @param digest Заявленный digest (16 байт)
     * @param raw_solution Решение головоломки, переданное вместе с digest
     * @return Result<void> Успех или ошибка:
     *         - Invalid*Length: некорректные аргументы
     *         - InvalidSolution: решение не проходит проверку головоломки
     *         - DigestMismatch: пересчитанный digest отличается
     */
    [[nodiscard]] Result<void> verify(
        ByteSpan challenge,
        ByteSpan data,
        ByteSpan nonce,
        ByteSpan digest,
        const puzzle::RawSolution& raw_solution
    ) const;

    /**
     * @brief Проверить решение, полученное из solve или из записи
     */
    [[nodiscard]] Result<void> verify(
        ByteSpan challenge,
        ByteSpan data,
        const Solution& solution
    ) const;

    [[nodiscard]] const ProofParams& params() const noexcept { return binder_.params(); }

    [[nodiscard]] const puzzle::PuzzleSolver& solver() const noexcept { return solver_; }

    [[nodiscard]] SelectionPolicy policy() const noexcept { return policy_; }

private:
    const puzzle::PuzzleSolver& solver_;
    ChallengeBinder binder_;
    SelectionPolicy policy_;
};

} // namespace segproof::proof
