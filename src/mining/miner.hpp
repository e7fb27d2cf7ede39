/**
 * @file miner.hpp
 * @brief Цикл майнинга: перебор nonce до достижения целевой сложности
 *
 * Каждый worker владеет собственной ареной решателя и перебирает свою
 * часть пространства nonce (см. NonceDistributor). Первое решение,
 * достигшее цели, останавливает остальных worker.
 */

#pragma once

#include "../core/types.hpp"
#include "../proof/prover.hpp"
#include "nonce_distributor.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace segproof::log {
class StatusReporter;
}

namespace segproof::mining {

// =============================================================================
// Конфигурация
// =============================================================================

/**
 * @brief Конфигурация майнера
 */
struct MinerConfig {
    /// @brief Целевая сложность (ведущие нулевые биты digest)
    uint32_t target_difficulty = constants::DEFAULT_TARGET_DIFFICULTY;

    /// @brief Количество потоков
    uint32_t workers = 1;

    /// @brief Первый перебираемый nonce
    uint64_t start_nonce = 0;

    /// @brief Лимит попыток на все потоки (0 = без лимита)
    uint64_t max_attempts = 0;

    /// @brief Стратегия распределения nonce
    NonceStrategy strategy = NonceStrategy::Interleaved;
};

// =============================================================================
// Статистика
// =============================================================================

/**
 * @brief Статистика последнего запуска mine()
 */
struct MinerStats {
    /// @brief Выполненные попытки solve
    uint64_t attempts = 0;

    /// @brief Nonce, для которых найдено решение
    uint64_t solutions = 0;

    /// @brief Nonce без решения головоломки
    uint64_t no_solution = 0;

    /// @brief Лучшая достигнутая сложность
    uint32_t best_difficulty = 0;

    /// @brief Время работы
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief Скорость перебора (попыток в секунду)
     */
    [[nodiscard]] double attempts_per_second() const noexcept {
        if (elapsed.count() <= 0) {
            return 0.0;
        }
        return static_cast<double>(attempts) * 1000.0 / static_cast<double>(elapsed.count());
    }
};

// =============================================================================
// Miner
// =============================================================================

/**
 * @brief Многопоточный перебор nonce
 *
 * Prover разделяется между потоками только для чтения.
 */
class Miner {
public:
    /**
     * @brief Создать майнер
     *
     * @param prover Прувер (должен пережить майнер)
     * @param config Конфигурация
     * @param reporter Репортёр статуса (может быть nullptr)
     */
    Miner(
        const proof::Prover& prover,
        const MinerConfig& config,
        log::StatusReporter* reporter = nullptr
    );

    ~Miner();

    // Запрещаем копирование
    Miner(const Miner&) = delete;
    Miner& operator=(const Miner&) = delete;

    /**
     * @brief Перебирать nonce до решения с целевой сложностью
     *
     * Блокирует вызывающий поток до завершения всех worker.
     *
     * @return Решение или ошибка:
     *         - InvalidChallengeLength/InvalidDataLength до запуска потоков
     *         - ConfigInvalidValue для некорректной конфигурации
     *         - MiningExhausted если исчерпан лимит попыток или пространство nonce
     *         - MiningStopped если вызван stop()
     *         - ошибка решателя (кроме NoSolutionFound) прерывает перебор
     */
    [[nodiscard]] Result<proof::Solution> mine(ByteSpan challenge, ByteSpan data);

    /**
     * @brief Запросить остановку (из любого потока)
     */
    void stop() noexcept;

    /**
     * @brief Идёт ли сейчас перебор
     */
    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Получить статистику
     */
    [[nodiscard]] MinerStats stats() const;

    /**
     * @brief Получить конфигурацию
     */
    [[nodiscard]] const MinerConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Проверка работы
// =============================================================================

/**
 * @brief Проверить доказательство и его сложность
 *
 * @return Ошибка verify, либо InsufficientDifficulty если
 *         difficulty < min_difficulty
 */
[[nodiscard]] Result<void> verify_work(
    const proof::Prover& prover,
    ByteSpan challenge,
    ByteSpan data,
    const proof::Solution& solution,
    uint32_t min_difficulty
);

} // namespace segproof::mining
