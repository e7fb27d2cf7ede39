/**
 * @file test_solver_arena.cpp
 * @brief Тесты арены решателя и её аренды
 */

#include <gtest/gtest.h>

#include "puzzle/puzzle_solver.hpp"

#include <algorithm>

namespace segproof::tests {

namespace {

class CountingArena : public puzzle::SolverArena {
public:
    CountingArena() : SolverArena(16) {}
    
    int resets = 0;
    
protected:
    void on_reset() noexcept override { ++resets; }
};

} // anonymous namespace

TEST(SolverArenaTest, ResetZeroesScratch) {
    puzzle::SolverArena arena(32);
    auto scratch = arena.scratch();
    std::fill(scratch.begin(), scratch.end(), uint8_t{0x5A});
    
    arena.reset();
    
    EXPECT_EQ(arena.capacity(), 32u);
    EXPECT_TRUE(std::all_of(scratch.begin(), scratch.end(), [](uint8_t b) { return b == 0; }));
    EXPECT_EQ(arena.generation(), 1u);
}

TEST(SolverArenaTest, ResetCallsHook) {
    CountingArena arena;
    
    arena.reset();
    arena.reset();
    
    EXPECT_EQ(arena.resets, 2);
    EXPECT_EQ(arena.generation(), 2u);
}

TEST(SolverArenaTest, LeaseIsExclusive) {
    puzzle::SolverArena arena;
    
    {
        puzzle::ArenaLease first(arena);
        EXPECT_TRUE(first.acquired());
        EXPECT_TRUE(arena.in_use());
        
        puzzle::ArenaLease second(arena);
        EXPECT_FALSE(second.acquired());
    }
    
    EXPECT_FALSE(arena.in_use());
    puzzle::ArenaLease again(arena);
    EXPECT_TRUE(again.acquired());
}

} // namespace segproof::tests
