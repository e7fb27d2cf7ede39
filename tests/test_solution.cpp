/**
 * @file test_solution.cpp
 * @brief Тесты записи решения (40 байт)
 */

#include <gtest/gtest.h>

#include "proof/solution.hpp"
#include "core/hex.hpp"

#include <algorithm>

namespace segproof::tests {

class SolutionRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        solution_.nonce = {1, 2, 3, 4, 5, 6, 7, 8};
        solution_.digest.fill(0);
        solution_.digest[1] = 0x10;
        solution_.solution = proof::canonicalize(raw_);
    }
    
    const puzzle::RawSolution raw_ = {18077, 20641, 50966, 22652, 20359, 11922, 883, 34009};
    proof::Solution solution_;
};

/**
 * @brief Тест: раскладка digest || nonce || solution
 */
TEST_F(SolutionRecordTest, Layout) {
    auto record = solution_.to_bytes();
    
    ASSERT_EQ(record.size(), 40u);
    EXPECT_EQ(record[1], 0x10);
    EXPECT_EQ(record[16], 1);
    EXPECT_EQ(record[23], 8);
    // Первый канонический индекс 883 = 0x0373
    EXPECT_EQ(record[24], 0x73);
    EXPECT_EQ(record[25], 0x03);
}

TEST_F(SolutionRecordTest, ParseBack) {
    auto record = solution_.to_bytes();
    auto parsed = proof::Solution::from_bytes(record);
    
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, solution_);
    EXPECT_EQ(parsed->difficulty(), 11u);
}

TEST_F(SolutionRecordTest, WrongLength) {
    Bytes record(39, 0);
    auto parsed = proof::Solution::from_bytes(record);
    
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidRecordLength);
}

/**
 * @brief Тест: неканоническое решение в записи отклоняется
 */
TEST_F(SolutionRecordTest, NonCanonicalRejected) {
    auto record = solution_.to_bytes();
    auto raw_bytes = proof::encode_solution(raw_);
    std::copy(raw_bytes.begin(), raw_bytes.end(), record.begin() + 24);
    
    auto parsed = proof::Solution::from_bytes(record);
    
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidSolution);
}

} // namespace segproof::tests
