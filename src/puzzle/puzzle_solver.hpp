/**
 * @file puzzle_solver.hpp
 * @brief Интерфейс memory-hard головоломки
 *
 * Ядро доказательства не реализует поиск решений: оно потребляет
 * внешнюю головоломку через две операции:
 * - generate(seed) - дорогой поиск всех решений для seed
 * - validate(seed, candidate) - дешёвая проверка одного решения
 *
 * Рабочая память решателя моделируется явной ареной (SolverArena),
 * принадлежащей одному worker. Одновременное использование одной арены
 * двумя потоками запрещено на уровне API через ArenaLease.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace segproof::puzzle {

// =============================================================================
// Типы решений
// =============================================================================

/**
 * @brief Решение в том виде, в котором его вернул решатель
 *
 * Упорядоченная последовательность индексов. Несколько байтово разных
 * решений могут быть эквивалентны (перестановки ветвей дерева).
 */
using RawSolution = std::array<uint16_t, constants::PUZZLE_INDEX_COUNT>;

// =============================================================================
// Арена
// =============================================================================

/**
 * @brief Переиспользуемая рабочая память решателя
 *
 * Принадлежит одному worker. Между вызовами generate арена сбрасывается
 * через reset(). Наследники хранят backend-специфичное состояние
 * (например, контекст EquiX).
 */
class SolverArena {
public:
    /**
     * @brief Создать арену с буфером заданного размера
     *
     * @param scratch_size Размер общего буфера в байтах (может быть 0)
     */
    explicit SolverArena(std::size_t scratch_size = 0);

    virtual ~SolverArena();

    // Запрещаем копирование и перемещение (адрес арены стабилен на время аренды)
    SolverArena(const SolverArena&) = delete;
    SolverArena& operator=(const SolverArena&) = delete;
    SolverArena(SolverArena&&) = delete;
    SolverArena& operator=(SolverArena&&) = delete;

    /**
     * @brief Сбросить содержимое арены перед следующим использованием
     */
    void reset() noexcept;

    /**
     * @brief Общий буфер арены
     */
    [[nodiscard]] MutableByteSpan scratch() noexcept;

    /**
     * @brief Размер общего буфера
     */
    [[nodiscard]] std::size_t capacity() const noexcept;

    /**
     * @brief Количество сбросов с момента создания
     */
    [[nodiscard]] uint64_t generation() const noexcept;

    /**
     * @brief Занята ли арена в данный момент
     */
    [[nodiscard]] bool in_use() const noexcept;

protected:
    /**
     * @brief Backend-специфичный сброс
     */
    virtual void on_reset() noexcept {}

private:
    friend class ArenaLease;

    [[nodiscard]] bool try_acquire() noexcept;
    void release() noexcept;

    Bytes scratch_;
    uint64_t generation_ = 0;
    std::atomic<bool> busy_{false};
};

/**
 * @brief RAII аренда арены
 *
 * Захватывает арену в конструкторе и освобождает в деструкторе.
 * Если арена уже занята другим вызовом, аренда не получена
 * и acquired() возвращает false.
 *
 * @code
 * puzzle::ArenaLease lease(arena);
 * if (!lease.acquired()) {
 *     return Err<Solution>(ErrorCode::ArenaBusy);
 * }
 * @endcode
 */
class ArenaLease {
public:
    explicit ArenaLease(SolverArena& arena) noexcept;
    ~ArenaLease();

    ArenaLease(const ArenaLease&) = delete;
    ArenaLease& operator=(const ArenaLease&) = delete;

    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

    [[nodiscard]] explicit operator bool() const noexcept { return acquired_; }

private:
    SolverArena& arena_;
    bool acquired_;
};

// =============================================================================
// Интерфейс решателя
// =============================================================================

/**
 * @brief Внешняя memory-hard головоломка
 *
 * Реализация должна быть детерминированной: повторные вызовы generate
 * с тем же seed дают тот же набор кандидатов. Методы const и могут
 * вызываться из разных потоков, если каждый поток передаёт свою арену.
 */
class PuzzleSolver {
public:
    virtual ~PuzzleSolver() = default;

    /**
     * @brief Найти все решения для seed
     *
     * @param seed Seed головоломки
     * @param arena Рабочая память (арендована вызывающим)
     * @return Result<std::vector<RawSolution>> Кандидаты (может быть пусто)
     *         или PuzzleFailure / ArenaMismatch
     */
    [[nodiscard]] virtual Result<std::vector<RawSolution>> generate(
        ByteSpan seed,
        SolverArena& arena
    ) const = 0;

    /**
     * @brief Проверить решение для seed
     *
     * @return true если candidate удовлетворяет предикату головоломки
     */
    [[nodiscard]] virtual bool validate(
        ByteSpan seed,
        const RawSolution& candidate
    ) const = 0;

    /**
     * @brief Создать арену, подходящую для этого решателя
     */
    [[nodiscard]] virtual std::unique_ptr<SolverArena> make_arena() const = 0;

    /**
     * @brief Название backend для логов
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace segproof::puzzle
