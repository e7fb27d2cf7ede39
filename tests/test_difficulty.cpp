/**
 * @file test_difficulty.cpp
 * @brief Тесты digest и оценки сложности
 */

#include <gtest/gtest.h>

#include "proof/canonicalizer.hpp"
#include "proof/difficulty.hpp"
#include "proof/digest.hpp"
#include "core/hex.hpp"

namespace segproof::tests {

// =============================================================================
// Сложность
// =============================================================================

TEST(DifficultyTest, AllZeroIsMaximum) {
    Digest digest{};
    
    EXPECT_EQ(proof::difficulty(digest), constants::MAX_DIFFICULTY);
    EXPECT_EQ(proof::difficulty(digest), 128u);
}

TEST(DifficultyTest, LeadingFFIsZero) {
    Digest digest{};
    digest[0] = 0xFF;
    
    EXPECT_EQ(proof::difficulty(digest), 0u);
}

TEST(DifficultyTest, CountsAcrossBytes) {
    Digest digest{};
    digest[1] = 0x01;  // 8 + 7 нулевых бит
    
    EXPECT_EQ(proof::difficulty(digest), 15u);
    
    Digest last{};
    last[15] = 0x80;
    EXPECT_EQ(proof::difficulty(last), 120u);
}

TEST(DifficultyTest, MeetsDifficulty) {
    Digest digest{};
    digest[0] = 0x0F;
    
    EXPECT_TRUE(proof::meets_difficulty(digest, 4));
    EXPECT_FALSE(proof::meets_difficulty(digest, 5));
    EXPECT_TRUE(proof::meets_difficulty(digest, 0));
}

TEST(DifficultyTest, BetterDigestIsBigEndianSmaller) {
    Digest a{};
    Digest b{};
    a[0] = 0x01;
    b[15] = 0xFF;
    
    EXPECT_TRUE(proof::is_better_digest(b, a));
    EXPECT_FALSE(proof::is_better_digest(a, b));
    EXPECT_FALSE(proof::is_better_digest(a, a));
}

// =============================================================================
// Digest
// =============================================================================

/**
 * @brief Тест: digest = keccak256(seed || solution || data)[0..16]
 */
TEST(DigestTest, PinnedValue) {
    Bytes data(64, 0x01);
    Bytes seed(32, 0x00);
    seed.insert(seed.end(), data.begin(), data.end());
    seed.insert(seed.end(), 8, 0x00);
    
    puzzle::RawSolution raw = {18077, 20641, 50966, 22652, 20359, 11922, 883, 34009};
    auto digest = proof::compute_digest(seed, proof::canonicalize(raw), data);
    
    EXPECT_EQ(to_hex(digest), "9fd505396eeb407dddbbfcb700637b27");
}

TEST(DigestTest, ConstantTimeEquality) {
    Digest a{};
    Digest b{};
    
    EXPECT_TRUE(proof::digests_equal(a, b));
    b[15] = 1;
    EXPECT_FALSE(proof::digests_equal(a, b));
}

} // namespace segproof::tests
