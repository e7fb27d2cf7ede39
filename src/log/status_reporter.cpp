/**
 * @file status_reporter.cpp
 * @brief Реализация терминального репортёра статуса
 */

#include "status_reporter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace segproof::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    
    // Цвета текста
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
    
    // Управление курсором
    constexpr const char* CLEAR_SCREEN = "\033[2J";
    constexpr const char* HOME = "\033[H";
}

// =============================================================================
// Уровни логирования
// =============================================================================

std::optional<LogLevel> level_from_string(std::string_view str) noexcept {
    if (str == "error") return LogLevel::Error;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "info") return LogLevel::Info;
    if (str == "debug") return LogLevel::Debug;
    return std::nullopt;
}

// =============================================================================
// Реализация
// =============================================================================

struct StatusReporter::Impl {
    LoggingConfig config;
    LogLevel level;
    
    // Состояние
    std::atomic<bool> running{false};
    std::thread render_thread;
    std::chrono::steady_clock::time_point start_time;
    
    // Данные
    MiningStats mining_stats;
    JobInfo job_info;
    
    // События
    std::deque<EventRecord> events;
    mutable std::mutex events_mutex;
    
    // Защита данных
    mutable std::mutex data_mutex;
    
    explicit Impl(const LoggingConfig& cfg) 
        : config(cfg)
        , level(level_from_string(cfg.level).value_or(LogLevel::Info))
        , start_time(std::chrono::steady_clock::now()) {}
    
    void render_loop() {
        while (running) {
            render_status();
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config.refresh_interval_ms)
            );
        }
    }
    
    void render_status() {
        std::string output = render_impl(config.color);
        
        if (config.color) {
            std::cout << ansi::HOME << output << std::flush;
        } else {
            std::cout << output << std::flush;
        }
    }
    
    std::string render_impl(bool use_color) const {
        std::ostringstream out;
        
        const char* bold = use_color ? ansi::BOLD : "";
        const char* reset = use_color ? ansi::RESET : "";
        const char* green = use_color ? ansi::GREEN : "";
        const char* yellow = use_color ? ansi::YELLOW : "";
        const char* red = use_color ? ansi::RED : "";
        const char* cyan = use_color ? ansi::CYAN : "";
        const char* dim = use_color ? ansi::DIM : "";
        
        std::lock_guard<std::mutex> lock(data_mutex);
        
        // === Заголовок ===
        out << bold << "═══════════════════════════════════════════════════════════════════\n"
            << "                 SEGPROOF PROOF-OF-ACCESS MINER\n"
            << "═══════════════════════════════════════════════════════════════════" << reset << "\n\n";
        
        // === Uptime ===
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time);
        auto hours = uptime.count() / 3600;
        auto minutes = (uptime.count() % 3600) / 60;
        auto seconds = uptime.count() % 60;
        
        out << bold << "Uptime: " << reset
            << std::setfill('0') << std::setw(2) << hours << ":"
            << std::setw(2) << minutes << ":"
            << std::setw(2) << seconds << std::setfill(' ') << "\n\n";
        
        // === Задание ===
        out << bold << "Job:" << reset << "\n";
        out << "  Solver: "
            << (job_info.solver_name.empty() ? "(none)" : job_info.solver_name) << "\n";
        out << "  Segment: " << job_info.segment_size << " bytes\n";
        out << "  Target: " << job_info.target_difficulty << " bits\n";
        out << "  Workers: " << job_info.workers << "\n\n";
        
        // === Майнинг ===
        out << bold << "Mining:" << reset << "\n";
        out << "  Attempts: " << mining_stats.attempts << "\n";
        out << "  Solutions: " << cyan << mining_stats.solutions << reset << "\n";
        out << "  No solution: " << mining_stats.no_solution << "\n";
        out << "  Best difficulty: ";
        if (job_info.target_difficulty > 0 &&
            mining_stats.best_difficulty >= job_info.target_difficulty) {
            out << green << mining_stats.best_difficulty << reset;
        } else {
            out << yellow << mining_stats.best_difficulty << reset;
        }
        out << " bits\n";
        out << "  Rate: " << std::fixed << std::setprecision(1)
            << mining_stats.attempts_per_second << " nonce/s\n\n";
        
        // === Recent Events ===
        out << bold << "Recent Events:" << reset << "\n";
        {
            std::lock_guard<std::mutex> events_lock(events_mutex);
            if (events.empty()) {
                out << "  " << dim << "(no events)" << reset << "\n";
            } else {
                // Показываем последние 10 событий
                size_t start = events.size() > 10 ? events.size() - 10 : 0;
                for (size_t i = start; i < events.size(); ++i) {
                    const auto& event = events[i];
                    
                    // Время
                    auto time = std::chrono::system_clock::to_time_t(event.timestamp);
                    std::tm tm{};
                    localtime_r(&time, &tm);
                    out << "  " << std::put_time(&tm, "%H:%M:%S") << " ";
                    
                    // Тип события
                    switch (event.type) {
                        case EventType::SOLUTION:
                            out << cyan << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::TARGET_MET:
                            out << bold << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::NO_SOLUTION:
                            out << dim << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::VERIFY_OK:
                            out << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::VERIFY_FAIL:
                        case EventType::ERROR:
                            out << red << "[" << to_string(event.type) << "]" << reset;
                            break;
                    }
                    
                    // Сообщение
                    out << " " << event.message;
                    out << dim << " (worker " << event.worker_id << ")" << reset;
                    out << "\n";
                }
            }
        }
        
        out << "\n" << bold << "───────────────────────────────────────────────────────────────────" << reset << "\n";
        
        return out.str();
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StatusReporter::StatusReporter(const LoggingConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

StatusReporter::~StatusReporter() {
    stop();
}

void StatusReporter::start() {
    if (impl_->running) {
        return;
    }
    
    impl_->running = true;
    impl_->start_time = std::chrono::steady_clock::now();
    
    // Очищаем экран если используются цвета
    if (impl_->config.color) {
        std::cout << ansi::CLEAR_SCREEN << ansi::HOME << std::flush;
    }
    
    impl_->render_thread = std::thread([this]() {
        impl_->render_loop();
    });
}

void StatusReporter::stop() {
    impl_->running = false;
    
    if (impl_->render_thread.joinable()) {
        impl_->render_thread.join();
    }
}

bool StatusReporter::is_running() const noexcept {
    return impl_->running;
}

LogLevel StatusReporter::level() const noexcept {
    return impl_->level;
}

void StatusReporter::update_mining_stats(const MiningStats& stats) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    impl_->mining_stats = stats;
}

void StatusReporter::update_job_info(const JobInfo& info) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    impl_->job_info = info;
}

void StatusReporter::log_event(EventType type, const std::string& message,
                               uint32_t worker_id) {
    if (event_level(type) > impl_->level) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    
    EventRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;
    record.worker_id = worker_id;
    
    impl_->events.push_back(std::move(record));
    
    // Ограничиваем размер истории
    while (impl_->events.size() > impl_->config.event_history) {
        impl_->events.pop_front();
    }
}

void StatusReporter::log_solution(uint32_t worker_id, uint64_t nonce, uint32_t difficulty) {
    log_event(EventType::SOLUTION,
              "nonce " + std::to_string(nonce) + " difficulty " + std::to_string(difficulty),
              worker_id);
}

void StatusReporter::log_target_met(uint32_t worker_id, uint64_t nonce, uint32_t difficulty) {
    log_event(EventType::TARGET_MET,
              "TARGET MET at nonce " + std::to_string(nonce) +
              " difficulty " + std::to_string(difficulty),
              worker_id);
}

void StatusReporter::log_no_solution(uint32_t worker_id, uint64_t nonce) {
    log_event(EventType::NO_SOLUTION, "nonce " + std::to_string(nonce), worker_id);
}

void StatusReporter::log_verify(bool success, const std::string& detail) {
    if (success) {
        log_event(EventType::VERIFY_OK, detail.empty() ? "Proof accepted" : detail);
    } else {
        log_event(EventType::VERIFY_FAIL, detail.empty() ? "Proof rejected" : detail);
    }
}

void StatusReporter::log_error(const std::string& message) {
    log_event(EventType::ERROR, message);
}

std::vector<EventRecord> StatusReporter::get_events() const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    return {impl_->events.begin(), impl_->events.end()};
}

std::string StatusReporter::render_plain() const {
    return impl_->render_impl(false);
}

std::string StatusReporter::render() const {
    return impl_->render_impl(impl_->config.color);
}

} // namespace segproof::log
