/**
 * @file test_nonce_distributor.cpp
 * @brief Тесты Nonce Distributor (распределение nonce между worker)
 */

#include <gtest/gtest.h>

#include "mining/nonce_distributor.hpp"

namespace segproof::tests {

class NonceDistributorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.workers = 4;
        config_.start_nonce = 0;
        config_.strategy = mining::NonceStrategy::Sequential;
    }
    
    mining::NonceDistributorConfig config_;
};

/**
 * @brief Тест: количество worker
 */
TEST_F(NonceDistributorTest, TotalWorkers) {
    mining::NonceDistributor distributor(config_);
    
    EXPECT_EQ(distributor.total_workers(), 4u);
    EXPECT_EQ(distributor.get_strategy(), mining::NonceStrategy::Sequential);
}

/**
 * @brief Тест: sequential стратегия - диапазоны
 */
TEST_F(NonceDistributorTest, SequentialRanges) {
    mining::NonceDistributor distributor(config_);
    
    auto range0 = distributor.get_range(0);
    EXPECT_EQ(range0.start, 0u);
    EXPECT_EQ(range0.end, 0x3FFFFFFFFFFFFFFFull);
    EXPECT_EQ(range0.worker_id, 0u);
    EXPECT_EQ(range0.step, 1u);
    
    auto range1 = distributor.get_range(1);
    EXPECT_EQ(range1.start, 0x4000000000000000ull);
    
    // Последний worker заканчивается на максимуме
    auto last_range = distributor.get_range(3);
    EXPECT_EQ(last_range.end, mining::NONCE_MAX);
}

TEST_F(NonceDistributorTest, SequentialCoverageAndNoOverlap) {
    config_.workers = 7;
    config_.start_nonce = 1000;
    mining::NonceDistributor distributor(config_);
    
    EXPECT_EQ(distributor.get_range(0).start, 1000u);
    EXPECT_TRUE(distributor.validate_coverage());
    EXPECT_TRUE(distributor.validate_no_overlap());
}

/**
 * @brief Тест: interleaved стратегия
 */
TEST_F(NonceDistributorTest, InterleavedRanges) {
    config_.workers = 3;
    config_.start_nonce = 10;
    config_.strategy = mining::NonceStrategy::Interleaved;
    mining::NonceDistributor distributor(config_);
    
    auto range1 = distributor.get_range(1);
    EXPECT_EQ(range1.start, 11u);
    EXPECT_EQ(range1.step, 3u);
    EXPECT_EQ(range1.end, mining::NONCE_MAX);
    
    EXPECT_TRUE(distributor.validate_coverage());
    EXPECT_TRUE(distributor.validate_no_overlap());
}

TEST_F(NonceDistributorTest, FindWorkerForNonce) {
    config_.workers = 3;
    config_.start_nonce = 10;
    config_.strategy = mining::NonceStrategy::Interleaved;
    mining::NonceDistributor distributor(config_);
    
    EXPECT_EQ(distributor.find_worker_for_nonce(10), 0u);
    EXPECT_EQ(distributor.find_worker_for_nonce(14), 1u);
    EXPECT_EQ(distributor.find_worker_for_nonce(18), 2u);
    EXPECT_FALSE(distributor.find_worker_for_nonce(9).has_value());
}

TEST_F(NonceDistributorTest, RangeContains) {
    mining::NonceRange range;
    range.start = 100;
    range.end = 200;
    range.step = 10;
    
    EXPECT_TRUE(range.contains(100));
    EXPECT_TRUE(range.contains(150));
    EXPECT_FALSE(range.contains(155));
    EXPECT_FALSE(range.contains(99));
    EXPECT_FALSE(range.contains(210));
}

TEST_F(NonceDistributorTest, RangeNext) {
    mining::NonceRange range;
    range.start = 0;
    range.end = 20;
    range.step = 10;
    
    EXPECT_EQ(range.next(0), 10u);
    EXPECT_EQ(range.next(10), 20u);
    EXPECT_FALSE(range.next(20).has_value());
    
    mining::NonceRange top;
    top.start = mining::NONCE_MAX - 1;
    top.end = mining::NONCE_MAX;
    top.step = 1;
    EXPECT_EQ(top.next(top.start), mining::NONCE_MAX);
    EXPECT_FALSE(top.next(mining::NONCE_MAX).has_value());
}

/**
 * @brief Тест: worker больше, чем значений nonce
 */
TEST_F(NonceDistributorTest, TinySpaceClampsWorkers) {
    config_.start_nonce = mining::NONCE_MAX - 1;
    mining::NonceDistributor distributor(config_);
    
    EXPECT_EQ(distributor.total_workers(), 2u);
    EXPECT_EQ(distributor.get_range(0).end, mining::NONCE_MAX - 1);
    EXPECT_EQ(distributor.get_range(1).start, mining::NONCE_MAX);
    EXPECT_TRUE(distributor.validate_coverage());
}

TEST_F(NonceDistributorTest, UnknownWorkerGivesEmptyRange) {
    mining::NonceDistributor distributor(config_);
    
    auto range = distributor.get_range(100);
    EXPECT_EQ(range.start, 0u);
    EXPECT_EQ(range.end, 0u);
}

TEST_F(NonceDistributorTest, StrategyFromString) {
    EXPECT_EQ(mining::strategy_from_string("sequential"), mining::NonceStrategy::Sequential);
    EXPECT_EQ(mining::strategy_from_string("interleaved"), mining::NonceStrategy::Interleaved);
    EXPECT_FALSE(mining::strategy_from_string("random").has_value());
    EXPECT_EQ(mining::to_string(mining::NonceStrategy::Interleaved), "interleaved");
}

/**
 * @brief Тест: nonce кодируется 8 байтами little-endian
 */
TEST_F(NonceDistributorTest, EncodeNonce) {
    auto nonce = mining::encode_nonce(0x0102030405060708ull);
    
    EXPECT_EQ(nonce[0], 0x08);
    EXPECT_EQ(nonce[7], 0x01);
    EXPECT_EQ(mining::decode_nonce(nonce), 0x0102030405060708ull);
    EXPECT_EQ(mining::encode_nonce(0), Nonce{});
}

} // namespace segproof::tests
