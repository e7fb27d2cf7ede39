/**
 * @file test_challenge_binder.cpp
 * @brief Тесты построения seed
 */

#include <gtest/gtest.h>

#include "proof/challenge_binder.hpp"

namespace segproof::tests {

class ChallengeBinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.segment_size = 4;
        challenge_.fill(0xCC);
        nonce_.fill(0x0E);
    }
    
    proof::ProofParams params_;
    Challenge challenge_{};
    Nonce nonce_{};
    Bytes data_ = {0xD0, 0xD1, 0xD2, 0xD3};
};

TEST_F(ChallengeBinderTest, DefaultSegmentSize) {
    proof::ProofParams defaults;
    
    EXPECT_EQ(defaults.segment_size, 128u);
    EXPECT_EQ(defaults.seed_size(), 32u + 128u + 8u);
}

/**
 * @brief Тест: seed = challenge || data || nonce
 */
TEST_F(ChallengeBinderTest, SeedLayout) {
    proof::ChallengeBinder binder(params_);
    
    auto seed = binder.bind(challenge_, data_, nonce_);
    
    ASSERT_TRUE(seed.has_value());
    ASSERT_EQ(seed->size(), params_.seed_size());
    EXPECT_EQ((*seed)[0], 0xCC);
    EXPECT_EQ((*seed)[31], 0xCC);
    EXPECT_EQ((*seed)[32], 0xD0);
    EXPECT_EQ((*seed)[35], 0xD3);
    EXPECT_EQ((*seed)[36], 0x0E);
    EXPECT_EQ((*seed)[43], 0x0E);
}

TEST_F(ChallengeBinderTest, WrongChallengeLength) {
    proof::ChallengeBinder binder(params_);
    Bytes short_challenge(31, 0);
    
    auto seed = binder.bind(short_challenge, data_, nonce_);
    
    ASSERT_FALSE(seed.has_value());
    EXPECT_EQ(seed.error().code, ErrorCode::InvalidChallengeLength);
}

TEST_F(ChallengeBinderTest, WrongDataLength) {
    proof::ChallengeBinder binder(params_);
    Bytes long_data(5, 0);
    
    auto seed = binder.bind(challenge_, long_data, nonce_);
    
    ASSERT_FALSE(seed.has_value());
    EXPECT_EQ(seed.error().code, ErrorCode::InvalidDataLength);
}

TEST_F(ChallengeBinderTest, WrongNonceLength) {
    proof::ChallengeBinder binder(params_);
    Bytes long_nonce(9, 0);
    
    auto seed = binder.bind(challenge_, data_, long_nonce);
    
    ASSERT_FALSE(seed.has_value());
    EXPECT_EQ(seed.error().code, ErrorCode::InvalidNonceLength);
}

/**
 * @brief Тест: challenge проверяется первым
 */
TEST_F(ChallengeBinderTest, ChallengeCheckedFirst) {
    proof::ChallengeBinder binder(params_);
    
    auto result = binder.check_inputs(ByteSpan{}, ByteSpan{}, ByteSpan{});
    
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidChallengeLength);
}

} // namespace segproof::tests
