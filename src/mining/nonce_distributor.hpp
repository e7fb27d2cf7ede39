/**
 * @file nonce_distributor.hpp
 * @brief Распределение пространства nonce между потоками майнинга
 *
 * Каждый worker перебирает свою часть 64-битного пространства nonce,
 * начиная со start_nonce, без пересечений с другими worker.
 *
 * Стратегии:
 * - Sequential: последовательное разбиение на непрерывные диапазоны
 * - Interleaved: чередование (worker[i] получает start + i + k * workers)
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace segproof::mining {

// =============================================================================
// Константы распределения nonce
// =============================================================================

/// @brief Максимальное значение nonce-счётчика
inline constexpr uint64_t NONCE_MAX = std::numeric_limits<uint64_t>::max();

// =============================================================================
// Стратегии распределения
// =============================================================================

/**
 * @brief Стратегия распределения nonce
 */
enum class NonceStrategy {
    Sequential,     ///< Последовательное разбиение
    Interleaved     ///< Чередование
};

/**
 * @brief Преобразовать стратегию в строку
 */
[[nodiscard]] constexpr std::string_view to_string(NonceStrategy strategy) noexcept {
    switch (strategy) {
        case NonceStrategy::Sequential:  return "sequential";
        case NonceStrategy::Interleaved: return "interleaved";
        default: return "unknown";
    }
}

/**
 * @brief Преобразовать строку в стратегию
 *
 * @return Стратегия или nullopt для неизвестной строки
 */
[[nodiscard]] std::optional<NonceStrategy> strategy_from_string(std::string_view str) noexcept;

// =============================================================================
// Конфигурация распределения
// =============================================================================

/**
 * @brief Конфигурация Nonce Distributor
 */
struct NonceDistributorConfig {
    /// @brief Количество worker
    uint32_t workers = 1;

    /// @brief Первый nonce пространства перебора
    uint64_t start_nonce = 0;

    /// @brief Стратегия распределения
    NonceStrategy strategy = NonceStrategy::Interleaved;
};

// =============================================================================
// Диапазон nonce
// =============================================================================

/**
 * @brief Диапазон nonce одного worker
 */
struct NonceRange {
    /// @brief ID worker
    uint32_t worker_id = 0;

    /// @brief Начало диапазона
    uint64_t start = 0;

    /// @brief Конец диапазона (включительно)
    uint64_t end = 0;

    /// @brief Шаг (для interleaved)
    uint64_t step = 1;

    /// @brief Стратегия
    NonceStrategy strategy = NonceStrategy::Sequential;

    /**
     * @brief Проверить, принадлежит ли nonce этому диапазону
     */
    [[nodiscard]] bool contains(uint64_t nonce) const noexcept {
        if (nonce < start || nonce > end) {
            return false;
        }
        return (nonce - start) % step == 0;
    }

    /**
     * @brief Получить следующий nonce после данного
     *
     * @param current Текущий nonce
     * @return Следующий nonce или nullopt если диапазон исчерпан
     */
    [[nodiscard]] std::optional<uint64_t> next(uint64_t current) const noexcept {
        if (current > end || end - current < step) {
            return std::nullopt;
        }
        return current + step;
    }
};

// =============================================================================
// Nonce Distributor
// =============================================================================

/**
 * @brief Распределитель nonce между worker
 */
class NonceDistributor {
public:
    /**
     * @brief Создать распределитель с конфигурацией
     */
    explicit NonceDistributor(const NonceDistributorConfig& config);

    ~NonceDistributor();

    // Запрещаем копирование
    NonceDistributor(const NonceDistributor&) = delete;
    NonceDistributor& operator=(const NonceDistributor&) = delete;

    // Разрешаем перемещение
    NonceDistributor(NonceDistributor&&) noexcept;
    NonceDistributor& operator=(NonceDistributor&&) noexcept;

    /**
     * @brief Получить диапазон для worker
     *
     * @param worker_id ID worker (0 - total_workers-1)
     * @return NonceRange Диапазон nonce (пустой для неизвестного ID)
     */
    [[nodiscard]] NonceRange get_range(uint32_t worker_id) const;

    /**
     * @brief Получить все диапазоны
     */
    [[nodiscard]] const std::vector<NonceRange>& get_all_ranges() const;

    /**
     * @brief Фактическое количество worker
     *
     * Может быть меньше запрошенного, если пространство nonce
     * меньше числа worker.
     */
    [[nodiscard]] uint32_t total_workers() const noexcept;

    /**
     * @brief Получить стратегию
     */
    [[nodiscard]] NonceStrategy get_strategy() const noexcept;

    /**
     * @brief Проверить, что всё пространство от start_nonce покрыто
     */
    [[nodiscard]] bool validate_coverage() const;

    /**
     * @brief Проверить отсутствие пересечений диапазонов
     */
    [[nodiscard]] bool validate_no_overlap() const;

    /**
     * @brief Найти, какому worker принадлежит nonce
     *
     * @return worker_id или nullopt если nonce вне пространства
     */
    [[nodiscard]] std::optional<uint32_t> find_worker_for_nonce(uint64_t nonce) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Вспомогательные функции
// =============================================================================

/**
 * @brief Закодировать счётчик в nonce (8 байт little-endian)
 */
[[nodiscard]] Nonce encode_nonce(uint64_t counter) noexcept;

/**
 * @brief Декодировать nonce в счётчик
 */
[[nodiscard]] uint64_t decode_nonce(const Nonce& nonce) noexcept;

} // namespace segproof::mining
