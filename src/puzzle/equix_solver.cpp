/**
 * @file equix_solver.cpp
 * @brief Реализация адаптера EquiX
 */

#include "equix_solver.hpp"

#include <equix.h>

#include <algorithm>
#include <memory>

namespace segproof::puzzle {

static_assert(EQUIX_NUM_IDX == constants::PUZZLE_INDEX_COUNT,
              "Количество индексов EquiX не совпадает с протоколом");
static_assert(sizeof(equix_idx) == sizeof(uint16_t),
              "Индекс EquiX должен быть 16-битным");

namespace {

equix_ctx_flags make_flags(bool solve, bool compile, bool huge_pages) noexcept {
    int flags = solve ? EQUIX_CTX_SOLVE : EQUIX_CTX_VERIFY;
    if (compile) {
        flags |= EQUIX_CTX_COMPILE;
    }
    if (huge_pages) {
        flags |= EQUIX_CTX_HUGEPAGES;
    }
    return static_cast<equix_ctx_flags>(flags);
}

} // anonymous namespace

void EquixCtxDeleter::operator()(equix_ctx* ctx) const noexcept {
    if (is_usable_context(ctx)) {
        equix_free(ctx);
    }
}

bool is_usable_context(const equix_ctx* ctx) noexcept {
    return ctx != nullptr && ctx != EQUIX_NOTSUPP;
}

EquixCtxPtr alloc_context(bool solve, bool compile, bool huge_pages) {
    equix_ctx* ctx = equix_alloc(make_flags(solve, compile, huge_pages));
    if (!is_usable_context(ctx)) {
        return EquixCtxPtr{};
    }
    return EquixCtxPtr{ctx};
}

// =============================================================================
// EquixArena
// =============================================================================

EquixArena::EquixArena(const EquixOptions& options) {
    if (options.try_compile) {
        ctx_ = alloc_context(true, true, options.huge_pages);
        compiled_ = static_cast<bool>(ctx_);
    }
    // JIT недоступен на этой платформе - интерпретатор
    if (!ctx_) {
        ctx_ = alloc_context(true, false, options.huge_pages);
    }
    // Huge pages могли быть не выделены
    if (!ctx_ && options.huge_pages) {
        ctx_ = alloc_context(true, false, false);
    }
}

// =============================================================================
// EquixSolver
// =============================================================================

EquixSolver::EquixSolver(const EquixOptions& options)
    : options_(options) {}

Result<std::vector<RawSolution>> EquixSolver::generate(
    ByteSpan seed,
    SolverArena& arena
) const {
    auto* equix_arena = dynamic_cast<EquixArena*>(&arena);
    if (equix_arena == nullptr) {
        return Err<std::vector<RawSolution>>(
            ErrorCode::ArenaMismatch,
            "Арена не создана решателем EquiX"
        );
    }
    if (equix_arena->context() == nullptr) {
        return Err<std::vector<RawSolution>>(
            ErrorCode::PuzzleFailure,
            "Не удалось выделить контекст EquiX"
        );
    }

    equix_solution output[EQUIX_MAX_SOLS];
    int count = equix_solve(equix_arena->context(), seed.data(), seed.size(), output);
    if (count < 0) {
        return Err<std::vector<RawSolution>>(ErrorCode::PuzzleFailure);
    }

    std::vector<RawSolution> solutions;
    solutions.reserve(static_cast<std::size_t>(count));

    for (int i = 0; i < count; ++i) {
        RawSolution raw{};
        std::copy(std::begin(output[i].idx), std::end(output[i].idx), raw.begin());
        solutions.push_back(raw);
    }

    return solutions;
}

bool EquixSolver::validate(ByteSpan seed, const RawSolution& candidate) const {
    // Контекст проверки не разделяется между потоками: программа HashX
    // перестраивается для каждого seed
    EquixCtxPtr ctx = alloc_context(false, options_.try_compile, false);
    if (!ctx && options_.try_compile) {
        ctx = alloc_context(false, false, false);
    }
    if (!ctx) {
        return false;
    }

    equix_solution solution{};
    std::copy(candidate.begin(), candidate.end(), std::begin(solution.idx));

    return equix_verify(ctx.get(), seed.data(), seed.size(), &solution) == EQUIX_OK;
}

std::unique_ptr<SolverArena> EquixSolver::make_arena() const {
    return std::make_unique<EquixArena>(options_);
}

} // namespace segproof::puzzle
