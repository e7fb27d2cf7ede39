/**
 * @file status_reporter.hpp
 * @brief Терминальный репортёр статуса майнера
 * 
 * Периодически выводит в терминал состояние майнинга с ANSI форматированием:
 * - Uptime и параметры задания (решатель, размер сегмента, цель)
 * - Счётчики попыток, найденных решений и nonce без решения
 * - Лучшая достигнутая сложность и скорость перебора
 * - Кольцевой буфер событий
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace segproof::log {

// =============================================================================
// Уровни логирования
// =============================================================================

/**
 * @brief Уровень логирования (по возрастанию подробности)
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

/**
 * @brief Преобразование уровня в строку
 */
[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать уровень из строки
 *
 * @return Уровень или nullopt для неизвестной строки
 */
[[nodiscard]] std::optional<LogLevel> level_from_string(std::string_view str) noexcept;

// =============================================================================
// Типы событий
// =============================================================================

/**
 * @brief Тип события для логирования
 */
enum class EventType {
    SOLUTION,       ///< Найдено решение для nonce
    TARGET_MET,     ///< Решение достигло целевой сложности
    NO_SOLUTION,    ///< Для nonce нет решения головоломки
    VERIFY_OK,      ///< Доказательство принято
    VERIFY_FAIL,    ///< Доказательство отклонено
    ERROR           ///< Ошибка
};

/**
 * @brief Преобразование типа события в строку
 */
[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::SOLUTION:    return "SOLUTION";
        case EventType::TARGET_MET:  return "TARGET_MET";
        case EventType::NO_SOLUTION: return "NO_SOLUTION";
        case EventType::VERIFY_OK:   return "VERIFY_OK";
        case EventType::VERIFY_FAIL: return "VERIFY_FAIL";
        case EventType::ERROR:       return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Уровень, на котором событие попадает в историю
 */
[[nodiscard]] constexpr LogLevel event_level(EventType type) noexcept {
    switch (type) {
        case EventType::ERROR:
        case EventType::VERIFY_FAIL: return LogLevel::Error;
        case EventType::NO_SOLUTION: return LogLevel::Debug;
        default: return LogLevel::Info;
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    uint32_t worker_id = 0;  ///< Поток майнинга, породивший событие
};

// =============================================================================
// Конфигурация
// =============================================================================

/**
 * @brief Конфигурация логирования
 */
struct LoggingConfig {
    /// @brief Интервал обновления экрана (мс)
    uint32_t refresh_interval_ms = 1000;
    
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";
    
    /// @brief Размер истории событий
    size_t event_history = 200;
    
    /// @brief Использовать цветной вывод
    bool color = true;
};

// =============================================================================
// Провайдеры данных
// =============================================================================

/**
 * @brief Статистика майнинга для отображения
 */
struct MiningStats {
    uint64_t attempts = 0;
    uint64_t solutions = 0;
    uint64_t no_solution = 0;
    uint32_t best_difficulty = 0;
    double attempts_per_second = 0.0;
};

/**
 * @brief Параметры текущего задания
 */
struct JobInfo {
    std::string solver_name;
    size_t segment_size = 0;
    uint32_t target_difficulty = 0;
    uint32_t workers = 0;
};

// =============================================================================
// Status Reporter
// =============================================================================

/**
 * @brief Терминальный репортёр статуса
 * 
 * Периодически выводит состояние майнинга в терминал.
 * Методы обновления и log_event безопасно вызывать из нескольких потоков.
 */
class StatusReporter {
public:
    /**
     * @brief Создать репортёр с конфигурацией
     *
     * Неизвестный уровень в конфигурации трактуется как "info".
     */
    explicit StatusReporter(const LoggingConfig& config);
    
    ~StatusReporter();
    
    // Запрещаем копирование
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;
    
    // ==========================================================================
    // Управление
    // ==========================================================================
    
    /**
     * @brief Запустить периодический вывод статуса
     */
    void start();
    
    /**
     * @brief Остановить вывод статуса
     */
    void stop();
    
    /**
     * @brief Проверить, запущен ли репортёр
     */
    [[nodiscard]] bool is_running() const noexcept;
    
    /**
     * @brief Текущий уровень фильтра событий
     */
    [[nodiscard]] LogLevel level() const noexcept;
    
    // ==========================================================================
    // Обновление данных
    // ==========================================================================
    
    /**
     * @brief Обновить статистику майнинга
     */
    void update_mining_stats(const MiningStats& stats);
    
    /**
     * @brief Обновить параметры задания
     */
    void update_job_info(const JobInfo& info);
    
    // ==========================================================================
    // События
    // ==========================================================================
    
    /**
     * @brief Записать событие
     *
     * События подробнее текущего уровня отбрасываются.
     */
    void log_event(EventType type, const std::string& message, uint32_t worker_id = 0);
    
    /**
     * @brief Записать событие SOLUTION
     */
    void log_solution(uint32_t worker_id, uint64_t nonce, uint32_t difficulty);
    
    /**
     * @brief Записать событие TARGET_MET
     */
    void log_target_met(uint32_t worker_id, uint64_t nonce, uint32_t difficulty);
    
    /**
     * @brief Записать событие NO_SOLUTION
     */
    void log_no_solution(uint32_t worker_id, uint64_t nonce);
    
    /**
     * @brief Записать результат проверки доказательства
     */
    void log_verify(bool success, const std::string& detail = "");
    
    /**
     * @brief Записать ошибку
     */
    void log_error(const std::string& message);
    
    /**
     * @brief Получить копию истории событий
     */
    [[nodiscard]] std::vector<EventRecord> get_events() const;
    
    // ==========================================================================
    // Рендеринг
    // ==========================================================================
    
    /**
     * @brief Получить текущий вывод статуса (без ANSI кодов)
     * 
     * Используется для тестирования.
     */
    [[nodiscard]] std::string render_plain() const;
    
    /**
     * @brief Получить текущий вывод статуса (с ANSI кодами)
     */
    [[nodiscard]] std::string render() const;
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace segproof::log
