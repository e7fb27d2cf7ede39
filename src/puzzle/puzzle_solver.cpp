/**
 * @file puzzle_solver.cpp
 * @brief Реализация арены решателя
 */

#include "puzzle_solver.hpp"

#include <algorithm>

namespace segproof::puzzle {

// =============================================================================
// SolverArena
// =============================================================================

SolverArena::SolverArena(std::size_t scratch_size)
    : scratch_(scratch_size, 0) {}

SolverArena::~SolverArena() = default;

void SolverArena::reset() noexcept {
    std::fill(scratch_.begin(), scratch_.end(), 0);
    ++generation_;
    on_reset();
}

MutableByteSpan SolverArena::scratch() noexcept {
    return MutableByteSpan{scratch_.data(), scratch_.size()};
}

std::size_t SolverArena::capacity() const noexcept {
    return scratch_.size();
}

uint64_t SolverArena::generation() const noexcept {
    return generation_;
}

bool SolverArena::in_use() const noexcept {
    return busy_.load(std::memory_order_acquire);
}

bool SolverArena::try_acquire() noexcept {
    bool expected = false;
    return busy_.compare_exchange_strong(
        expected, true,
        std::memory_order_acquire,
        std::memory_order_relaxed
    );
}

void SolverArena::release() noexcept {
    busy_.store(false, std::memory_order_release);
}

// =============================================================================
// ArenaLease
// =============================================================================

ArenaLease::ArenaLease(SolverArena& arena) noexcept
    : arena_(arena)
    , acquired_(arena.try_acquire()) {}

ArenaLease::~ArenaLease() {
    if (acquired_) {
        arena_.release();
    }
}

} // namespace segproof::puzzle
