/**
 * @file nonce_distributor.cpp
 * @brief Реализация распределителя nonce между worker
 */

#include "nonce_distributor.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>

namespace segproof::mining {

// =============================================================================
// Преобразование строки в стратегию
// =============================================================================

std::optional<NonceStrategy> strategy_from_string(std::string_view str) noexcept {
    if (str == "sequential" || str == "seq") {
        return NonceStrategy::Sequential;
    }
    if (str == "interleaved" || str == "int") {
        return NonceStrategy::Interleaved;
    }
    return std::nullopt;
}

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct NonceDistributor::Impl {
    NonceDistributorConfig config;
    std::vector<NonceRange> ranges;

    explicit Impl(const NonceDistributorConfig& cfg) : config(cfg) {
        build_ranges();
    }

    void build_ranges() {
        ranges.clear();

        if (config.workers == 0) return;

        // Не больше worker, чем значений в пространстве
        uint64_t span = NONCE_MAX - config.start_nonce;
        if (span < config.workers) {
            config.workers = static_cast<uint32_t>(span + 1);
        }

        ranges.reserve(config.workers);

        switch (config.strategy) {
            case NonceStrategy::Sequential:
                build_sequential(span);
                break;
            case NonceStrategy::Interleaved:
                build_interleaved();
                break;
        }
    }

    void build_sequential(uint64_t span) {
        uint64_t chunk = span / config.workers + 1;
        uint64_t current_start = config.start_nonce;

        for (uint32_t i = 0; i < config.workers; ++i) {
            NonceRange range;
            range.worker_id = i;
            range.strategy = NonceStrategy::Sequential;
            range.step = 1;
            range.start = current_start;

            // Последний диапазон добирает остаток до конца пространства
            if (i + 1 == config.workers || NONCE_MAX - current_start < chunk) {
                range.end = NONCE_MAX;
            } else {
                range.end = current_start + chunk - 1;
            }

            ranges.push_back(range);

            if (range.end == NONCE_MAX) {
                break;
            }
            current_start = range.end + 1;
        }

        config.workers = static_cast<uint32_t>(ranges.size());
    }

    void build_interleaved() {
        for (uint32_t i = 0; i < config.workers; ++i) {
            NonceRange range;
            range.worker_id = i;
            range.strategy = NonceStrategy::Interleaved;

            // Чередование: worker[i] получает start + i + k * workers
            range.start = config.start_nonce + i;
            range.end = NONCE_MAX;
            range.step = config.workers;

            ranges.push_back(range);
        }
    }
};

// =============================================================================
// NonceDistributor публичный интерфейс
// =============================================================================

NonceDistributor::NonceDistributor(const NonceDistributorConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

NonceDistributor::~NonceDistributor() = default;

NonceDistributor::NonceDistributor(NonceDistributor&&) noexcept = default;
NonceDistributor& NonceDistributor::operator=(NonceDistributor&&) noexcept = default;

NonceRange NonceDistributor::get_range(uint32_t worker_id) const {
    if (worker_id < impl_->ranges.size()) {
        return impl_->ranges[worker_id];
    }
    return NonceRange{};
}

const std::vector<NonceRange>& NonceDistributor::get_all_ranges() const {
    return impl_->ranges;
}

uint32_t NonceDistributor::total_workers() const noexcept {
    return static_cast<uint32_t>(impl_->ranges.size());
}

NonceStrategy NonceDistributor::get_strategy() const noexcept {
    return impl_->config.strategy;
}

bool NonceDistributor::validate_coverage() const {
    if (impl_->ranges.empty()) return false;

    if (impl_->config.strategy == NonceStrategy::Interleaved) {
        // Стартовые точки должны быть подряд, шаг равен числу worker
        for (const auto& range : impl_->ranges) {
            if (range.start != impl_->config.start_nonce + range.worker_id ||
                range.step != impl_->ranges.size() ||
                range.end != NONCE_MAX) {
                return false;
            }
        }
        return true;
    }

    // Диапазоны строятся по возрастанию, копировать и сортировать не нужно
    uint64_t expected_start = impl_->config.start_nonce;
    for (std::size_t i = 0; i < impl_->ranges.size(); ++i) {
        const auto& range = impl_->ranges[i];
        if (range.start != expected_start) {
            return false;  // Пробел в покрытии
        }
        if (range.end == NONCE_MAX) {
            return i + 1 == impl_->ranges.size();
        }
        expected_start = range.end + 1;
    }

    return false;
}

bool NonceDistributor::validate_no_overlap() const {
    if (impl_->ranges.empty()) return true;

    if (impl_->config.strategy == NonceStrategy::Interleaved) {
        // Разные остатки по модулю числа worker
        for (const auto& range : impl_->ranges) {
            if (range.step != impl_->ranges.size()) {
                return false;
            }
        }
        return true;
    }

    std::vector<NonceRange> sorted = impl_->ranges;
    std::sort(sorted.begin(), sorted.end(),
        [](const NonceRange& a, const NonceRange& b) {
            return a.start < b.start;
        });

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i].start <= sorted[i - 1].end) {
            return false;  // Пересечение
        }
    }

    return true;
}

std::optional<uint32_t> NonceDistributor::find_worker_for_nonce(uint64_t nonce) const {
    for (const auto& range : impl_->ranges) {
        if (range.contains(nonce)) {
            return range.worker_id;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Вспомогательные функции
// =============================================================================

Nonce encode_nonce(uint64_t counter) noexcept {
    Nonce nonce{};
    write_le64(nonce.data(), counter);
    return nonce;
}

uint64_t decode_nonce(const Nonce& nonce) noexcept {
    return read_le64(nonce.data());
}

} // namespace segproof::mining
