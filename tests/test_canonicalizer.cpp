/**
 * @file test_canonicalizer.cpp
 * @brief Тесты канонизации решений
 */

#include <gtest/gtest.h>

#include "proof/canonicalizer.hpp"

#include <algorithm>

namespace segproof::tests {

using puzzle::RawSolution;

class CanonicalizerTest : public ::testing::Test {
protected:
    const RawSolution raw_ = {18077, 20641, 50966, 22652, 20359, 11922, 883, 34009};
    const RawSolution expected_ = {883, 34009, 11922, 20359, 18077, 20641, 22652, 50966};
};

TEST_F(CanonicalizerTest, KnownOrdering) {
    auto canonical = proof::canonicalize(raw_);
    
    EXPECT_EQ(canonical.indices(), expected_);
    EXPECT_TRUE(proof::is_canonical(expected_));
    EXPECT_FALSE(proof::is_canonical(raw_));
}

TEST_F(CanonicalizerTest, Idempotent) {
    auto once = proof::canonicalize(raw_);
    auto twice = proof::canonicalize(once.indices());
    
    EXPECT_EQ(once, twice);
}

/**
 * @brief Тест: все перестановки дерева дают одну форму
 * 
 * Перебираем 7 битов: по одному на каждый узел дерева (4 + 2 + 1).
 */
TEST_F(CanonicalizerTest, AllTreeSwapsCollapse) {
    for (unsigned mask = 0; mask < 128; ++mask) {
        RawSolution variant = raw_;
        unsigned bit = 0;
        for (std::size_t width = 1; width < variant.size(); width *= 2) {
            for (std::size_t block = 0; block < variant.size(); block += 2 * width) {
                if (mask & (1u << bit)) {
                    std::swap_ranges(variant.begin() + block,
                                     variant.begin() + block + width,
                                     variant.begin() + block + width);
                }
                ++bit;
            }
        }
        EXPECT_EQ(proof::canonicalize(variant).indices(), expected_) << "mask " << mask;
    }
}

TEST_F(CanonicalizerTest, ReversedIsSameClass) {
    RawSolution reversed = raw_;
    std::reverse(reversed.begin(), reversed.end());
    
    EXPECT_EQ(proof::canonicalize(reversed), proof::canonicalize(raw_));
}

/**
 * @brief Тест: разные классы не склеиваются
 * 
 * Перестановка между поддеревьями не является свободной.
 */
TEST_F(CanonicalizerTest, DistinctClassesStayDistinct) {
    RawSolution a = {1, 2, 3, 4, 5, 6, 7, 8};
    RawSolution b = {1, 3, 2, 4, 5, 6, 7, 8};
    
    EXPECT_NE(proof::canonicalize(a), proof::canonicalize(b));
}

TEST_F(CanonicalizerTest, EqualBlocksAreStable) {
    RawSolution same = {7, 7, 7, 7, 7, 7, 7, 7};
    
    EXPECT_EQ(proof::canonicalize(same).indices(), same);
}

/**
 * @brief Тест: индексы кодируются little-endian
 */
TEST_F(CanonicalizerTest, EncodeLittleEndian) {
    RawSolution raw = {0x0102, 0, 0, 0, 0, 0, 0, 0xFFEE};
    auto bytes = proof::encode_solution(raw);
    
    EXPECT_EQ(bytes[0], 0x02);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(bytes[14], 0xEE);
    EXPECT_EQ(bytes[15], 0xFF);
    
    auto decoded = proof::decode_solution(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, raw);
}

TEST_F(CanonicalizerTest, DecodeWrongLength) {
    Bytes bytes(15, 0);
    auto decoded = proof::decode_solution(bytes);
    
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::InvalidSolution);
}

} // namespace segproof::tests
