/**
 * @file equix_solver.hpp
 * @brief Адаптер головоломки EquiX
 *
 * EquiX (tevador/equix) - memory-hard головоломка на основе HashX
 * и обобщённой задачи дней рождения. Решение - 8 индексов по 16 бит.
 *
 * Собирается только если в системе найдены equix.h и libequix
 * (макрос SEGPROOF_HAS_EQUIX).
 */

#pragma once

#include "puzzle_solver.hpp"

#include <memory>

struct equix_ctx;

namespace segproof::puzzle {

/**
 * @brief Параметры backend EquiX
 */
struct EquixOptions {
    /// @brief Пытаться JIT-компилировать программу HashX (с откатом на интерпретатор)
    bool try_compile = true;

    /// @brief Использовать huge pages для памяти решателя
    bool huge_pages = false;
};

/**
 * @brief Освобождение контекста EquiX через equix_free
 */
struct EquixCtxDeleter {
    void operator()(equix_ctx* ctx) const noexcept;
};

/// @brief Владеющий указатель на контекст EquiX
using EquixCtxPtr = std::unique_ptr<equix_ctx, EquixCtxDeleter>;

/**
 * @brief Выделить контекст EquiX
 *
 * Сентинел EQUIX_NOTSUPP (JIT не поддерживается платформой) и nullptr
 * приводятся к пустому указателю, поэтому equix_free никогда не
 * получает сентинел.
 *
 * @param solve true - контекст решателя, false - контекст проверки
 * @param compile Запросить JIT компиляцию HashX
 * @param huge_pages Запросить huge pages
 */
[[nodiscard]] EquixCtxPtr alloc_context(bool solve, bool compile, bool huge_pages);

/**
 * @brief Пригоден ли указатель, возвращённый equix_alloc
 *
 * @return false для nullptr и EQUIX_NOTSUPP
 */
[[nodiscard]] bool is_usable_context(const equix_ctx* ctx) noexcept;

/**
 * @brief Арена EquiX: контекст решателя с собственной памятью
 *
 * Контекст EquiX хранит программу HashX и кучу решателя (~1.8 МБ),
 * поэтому не может использоваться двумя потоками одновременно.
 */
class EquixArena final : public SolverArena {
public:
    explicit EquixArena(const EquixOptions& options);

    /**
     * @brief Контекст EquiX (nullptr если выделение не удалось)
     */
    [[nodiscard]] equix_ctx* context() const noexcept { return ctx_.get(); }

    /**
     * @brief Удалось ли включить JIT компиляцию
     */
    [[nodiscard]] bool compiled() const noexcept { return compiled_; }

private:
    EquixCtxPtr ctx_;
    bool compiled_ = false;
};

/**
 * @brief Решатель на основе EquiX
 */
class EquixSolver final : public PuzzleSolver {
public:
    explicit EquixSolver(const EquixOptions& options = {});

    [[nodiscard]] Result<std::vector<RawSolution>> generate(
        ByteSpan seed,
        SolverArena& arena
    ) const override;

    [[nodiscard]] bool validate(
        ByteSpan seed,
        const RawSolution& candidate
    ) const override;

    [[nodiscard]] std::unique_ptr<SolverArena> make_arena() const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "equix"; }

private:
    EquixOptions options_;
};

} // namespace segproof::puzzle
