/**
 * @file test_status_reporter.cpp
 * @brief Тесты для терминального вывода статуса
 */

#include <gtest/gtest.h>

#include "log/status_reporter.hpp"

#include <thread>
#include <chrono>

namespace segproof::tests {

// =============================================================================
// Тесты конфигурации
// =============================================================================

TEST(LoggingConfigTest, DefaultValues) {
    log::LoggingConfig config;
    
    EXPECT_EQ(config.level, "info");
    EXPECT_EQ(config.refresh_interval_ms, 1000u);
    EXPECT_EQ(config.event_history, 200u);
    EXPECT_TRUE(config.color);
}

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(log::level_from_string("error"), log::LogLevel::Error);
    EXPECT_EQ(log::level_from_string("warn"), log::LogLevel::Warn);
    EXPECT_EQ(log::level_from_string("info"), log::LogLevel::Info);
    EXPECT_EQ(log::level_from_string("debug"), log::LogLevel::Debug);
    EXPECT_FALSE(log::level_from_string("verbose").has_value());
}

// =============================================================================
// Тесты EventType
// =============================================================================

TEST(EventTypeTest, ToString) {
    EXPECT_EQ(log::to_string(log::EventType::SOLUTION), "SOLUTION");
    EXPECT_EQ(log::to_string(log::EventType::TARGET_MET), "TARGET_MET");
    EXPECT_EQ(log::to_string(log::EventType::NO_SOLUTION), "NO_SOLUTION");
    EXPECT_EQ(log::to_string(log::EventType::VERIFY_OK), "VERIFY_OK");
    EXPECT_EQ(log::to_string(log::EventType::VERIFY_FAIL), "VERIFY_FAIL");
    EXPECT_EQ(log::to_string(log::EventType::ERROR), "ERROR");
}

// =============================================================================
// Тесты StatusReporter
// =============================================================================

class StatusReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.color = false;  // Отключаем цвета для тестов
        config_.refresh_interval_ms = 100;
        config_.event_history = 10;
    }
    
    log::LoggingConfig config_;
};

/**
 * @brief Тест: создание репортера
 */
TEST_F(StatusReporterTest, Creation) {
    log::StatusReporter reporter(config_);
    
    EXPECT_FALSE(reporter.is_running());
    EXPECT_EQ(reporter.level(), log::LogLevel::Info);
}

/**
 * @brief Тест: неизвестный уровень трактуется как info
 */
TEST_F(StatusReporterTest, UnknownLevelFallsBackToInfo) {
    config_.level = "loud";
    log::StatusReporter reporter(config_);
    
    EXPECT_EQ(reporter.level(), log::LogLevel::Info);
}

/**
 * @brief Тест: добавление событий
 */
TEST_F(StatusReporterTest, AddEvents) {
    log::StatusReporter reporter(config_);
    
    reporter.log_solution(0, 5, 3);
    reporter.log_target_met(1, 9, 12);
    
    auto events = reporter.get_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, log::EventType::SOLUTION);
    EXPECT_EQ(events[1].type, log::EventType::TARGET_MET);
    EXPECT_EQ(events[1].worker_id, 1u);
    EXPECT_NE(events[1].message.find("nonce 9"), std::string::npos);
}

/**
 * @brief Тест: ограничение истории событий
 */
TEST_F(StatusReporterTest, EventHistoryLimit) {
    config_.event_history = 5;
    log::StatusReporter reporter(config_);
    
    // Добавляем 10 событий
    for (int i = 0; i < 10; ++i) {
        reporter.log_error("Error " + std::to_string(i));
    }
    
    auto events = reporter.get_events();
    EXPECT_EQ(events.size(), 5u);
    
    // Проверяем что остались последние 5
    EXPECT_EQ(events[0].message, "Error 5");
}

/**
 * @brief Тест: фильтр по уровню
 */
TEST_F(StatusReporterTest, LevelFilter) {
    config_.level = "info";
    log::StatusReporter info_reporter(config_);
    info_reporter.log_no_solution(0, 1);
    info_reporter.log_verify(true);
    EXPECT_EQ(info_reporter.get_events().size(), 1u);
    
    config_.level = "error";
    log::StatusReporter error_reporter(config_);
    error_reporter.log_solution(0, 1, 1);
    error_reporter.log_verify(true);
    error_reporter.log_verify(false, "digest mismatch");
    error_reporter.log_error("boom");
    
    auto events = error_reporter.get_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, log::EventType::VERIFY_FAIL);
    EXPECT_EQ(events[0].message, "digest mismatch");
    
    config_.level = "debug";
    log::StatusReporter debug_reporter(config_);
    debug_reporter.log_no_solution(0, 1);
    EXPECT_EQ(debug_reporter.get_events().size(), 1u);
}

/**
 * @brief Тест: рендеринг статуса без цветов
 */
TEST_F(StatusReporterTest, RenderStatusPlain) {
    log::StatusReporter reporter(config_);
    
    log::JobInfo info;
    info.solver_name = "equix";
    info.segment_size = 128;
    info.target_difficulty = 16;
    info.workers = 4;
    reporter.update_job_info(info);
    
    log::MiningStats stats;
    stats.attempts = 1500;
    stats.solutions = 2800;
    stats.no_solution = 120;
    stats.best_difficulty = 17;
    stats.attempts_per_second = 250.5;
    reporter.update_mining_stats(stats);
    
    reporter.log_target_met(2, 1499, 17);
    
    std::string output = reporter.render_plain();
    
    EXPECT_NE(output.find("Uptime"), std::string::npos);
    EXPECT_NE(output.find("Solver: equix"), std::string::npos);
    EXPECT_NE(output.find("Segment: 128 bytes"), std::string::npos);
    EXPECT_NE(output.find("Attempts: 1500"), std::string::npos);
    EXPECT_NE(output.find("Best difficulty: 17 bits"), std::string::npos);
    EXPECT_NE(output.find("250.5 nonce/s"), std::string::npos);
    EXPECT_NE(output.find("[TARGET_MET]"), std::string::npos);
    EXPECT_EQ(output.find("\033["), std::string::npos);
}

/**
 * @brief Тест: пустая история
 */
TEST_F(StatusReporterTest, NoEvents) {
    log::StatusReporter reporter(config_);
    
    EXPECT_NE(reporter.render_plain().find("(no events)"), std::string::npos);
}

/**
 * @brief Тест: запуск и остановка
 */
TEST_F(StatusReporterTest, StartStop) {
    log::StatusReporter reporter(config_);
    
    EXPECT_FALSE(reporter.is_running());
    
    reporter.start();
    EXPECT_TRUE(reporter.is_running());
    
    // Даём немного поработать
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    
    reporter.stop();
    EXPECT_FALSE(reporter.is_running());
}

} // namespace segproof::tests
