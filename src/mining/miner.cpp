/**
 * @file miner.cpp
 * @brief Реализация цикла майнинга
 */

#include "miner.hpp"
#include "../log/status_reporter.hpp"
#include "../proof/challenge_binder.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace segproof::mining {

namespace {

/// @brief Период публикации статистики в репортёр (попыток на worker)
constexpr uint64_t STATS_PUBLISH_INTERVAL = 16;

} // anonymous namespace

// =============================================================================
// Внутренняя реализация
// =============================================================================

struct Miner::Impl {
    const proof::Prover& prover;
    MinerConfig config;
    log::StatusReporter* reporter;

    // Управление
    std::mutex run_mutex;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> found{false};
    std::atomic<bool> failed{false};
    std::atomic<uint64_t> claimed{0};

    // Счётчики
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> solutions{0};
    std::atomic<uint64_t> no_solution{0};
    std::atomic<uint32_t> best_difficulty{0};

    // Время запуска (под result_mutex)
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;

    // Результат
    std::mutex result_mutex;
    std::optional<proof::Solution> winner;
    std::optional<Error> error;

    Impl(const proof::Prover& p, const MinerConfig& cfg, log::StatusReporter* r)
        : prover(p), config(cfg), reporter(r) {}

    /// @brief Сбросить состояние перед запуском
    ///
    /// stop_requested не сбрасывается: stop(), вызванный до mine(),
    /// должен остановить ближайший запуск.
    void reset_state() {
        found = false;
        failed = false;
        claimed = 0;
        attempts = 0;
        solutions = 0;
        no_solution = 0;
        best_difficulty = 0;

        std::lock_guard<std::mutex> lock(result_mutex);
        winner.reset();
        error.reset();
        start_time = std::chrono::steady_clock::now();
        end_time = start_time;
    }

    void mark_finished() {
        std::lock_guard<std::mutex> lock(result_mutex);
        end_time = std::chrono::steady_clock::now();
        running = false;
    }

    [[nodiscard]] bool should_stop() const noexcept {
        return found || failed || stop_requested;
    }

    /// @brief Зарезервировать попытку в общем лимите
    [[nodiscard]] bool claim_attempt() noexcept {
        if (config.max_attempts == 0) {
            return true;
        }
        return claimed.fetch_add(1) < config.max_attempts;
    }

    void update_best(uint32_t value) noexcept {
        uint32_t current = best_difficulty.load();
        while (value > current && !best_difficulty.compare_exchange_weak(current, value)) {
        }
    }

    MinerStats snapshot() {
        MinerStats stats;
        stats.attempts = attempts.load();
        stats.solutions = solutions.load();
        stats.no_solution = no_solution.load();
        stats.best_difficulty = best_difficulty.load();

        std::lock_guard<std::mutex> lock(result_mutex);
        auto until = running ? std::chrono::steady_clock::now() : end_time;
        stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(until - start_time);
        return stats;
    }

    void publish_stats() {
        if (!reporter) return;

        MinerStats stats = snapshot();
        log::MiningStats view;
        view.attempts = stats.attempts;
        view.solutions = stats.solutions;
        view.no_solution = stats.no_solution;
        view.best_difficulty = stats.best_difficulty;
        view.attempts_per_second = stats.attempts_per_second();
        reporter->update_mining_stats(view);
    }

    void record_error(const Error& err, uint32_t worker_id) {
        {
            std::lock_guard<std::mutex> lock(result_mutex);
            if (!error) {
                error = err;
            }
        }
        failed = true;
        if (reporter) {
            reporter->log_event(log::EventType::ERROR, err.message, worker_id);
        }
    }

    void worker_loop(uint32_t worker_id, const NonceRange& range,
                     ByteSpan challenge, ByteSpan data) {
        auto arena = prover.solver().make_arena();
        if (!arena) {
            record_error(Error{ErrorCode::SystemOutOfMemory}, worker_id);
            return;
        }

        uint64_t counter = range.start;
        uint64_t local_attempts = 0;

        while (!should_stop()) {
            if (!claim_attempt()) {
                break;
            }

            Nonce nonce = encode_nonce(counter);
            auto result = prover.solve(challenge, data, nonce, *arena);
            ++attempts;
            ++local_attempts;

            if (!result) {
                if (result.error().code != ErrorCode::NoSolutionFound) {
                    record_error(result.error(), worker_id);
                    break;
                }
                ++no_solution;
                if (reporter) {
                    reporter->log_no_solution(worker_id, counter);
                }
            } else {
                ++solutions;
                uint32_t value = result->difficulty();
                update_best(value);
                if (reporter) {
                    reporter->log_solution(worker_id, counter, value);
                }

                if (value >= config.target_difficulty) {
                    std::lock_guard<std::mutex> lock(result_mutex);
                    if (!found) {
                        winner = *result;
                        found = true;
                        if (reporter) {
                            reporter->log_target_met(worker_id, counter, value);
                        }
                    }
                    break;
                }
            }

            if (local_attempts % STATS_PUBLISH_INTERVAL == 0) {
                publish_stats();
            }

            auto next = range.next(counter);
            if (!next) {
                break;  // Диапазон worker исчерпан
            }
            counter = *next;
        }
    }
};

// =============================================================================
// Публичный API
// =============================================================================

Miner::Miner(
    const proof::Prover& prover,
    const MinerConfig& config,
    log::StatusReporter* reporter
)
    : impl_(std::make_unique<Impl>(prover, config, reporter)) {}

Miner::~Miner() {
    stop();
}

Result<proof::Solution> Miner::mine(ByteSpan challenge, ByteSpan data) {
    const auto& config = impl_->config;

    if (config.workers == 0 || config.workers > constants::MAX_WORKERS) {
        return Err<proof::Solution>(
            ErrorCode::ConfigInvalidValue,
            "mining.workers должен быть в диапазоне 1-" + std::to_string(constants::MAX_WORKERS)
        );
    }
    if (config.target_difficulty > constants::MAX_DIFFICULTY) {
        return Err<proof::Solution>(
            ErrorCode::ConfigInvalidValue,
            "mining.target_difficulty не может превышать " +
                std::to_string(constants::MAX_DIFFICULTY)
        );
    }

    // Ошибки длины обнаруживаем до запуска потоков
    proof::ChallengeBinder binder(impl_->prover.params());
    Nonce first = encode_nonce(config.start_nonce);
    if (auto check = binder.check_inputs(challenge, data, first); !check) {
        return std::unexpected(check.error());
    }

    std::unique_lock<std::mutex> run_lock(impl_->run_mutex, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        return Err<proof::Solution>(ErrorCode::MinerBusy);
    }

    impl_->reset_state();
    impl_->running = true;

    NonceDistributorConfig dist_config;
    dist_config.workers = config.workers;
    dist_config.start_nonce = config.start_nonce;
    dist_config.strategy = config.strategy;
    NonceDistributor distributor(dist_config);

    if (impl_->reporter) {
        log::JobInfo info;
        info.solver_name = std::string(impl_->prover.solver().name());
        info.segment_size = impl_->prover.params().segment_size;
        info.target_difficulty = config.target_difficulty;
        info.workers = distributor.total_workers();
        impl_->reporter->update_job_info(info);
    }

    std::vector<std::thread> threads;
    threads.reserve(distributor.total_workers());
    for (const auto& range : distributor.get_all_ranges()) {
        threads.emplace_back([this, range, challenge, data]() {
            impl_->worker_loop(range.worker_id, range, challenge, data);
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    impl_->mark_finished();
    impl_->publish_stats();

    // Запрос остановки относится только к этому запуску
    bool stopped = impl_->stop_requested.exchange(false);

    if (impl_->winner) {
        return *impl_->winner;
    }
    if (impl_->error) {
        return std::unexpected(*impl_->error);
    }
    if (stopped) {
        return Err<proof::Solution>(ErrorCode::MiningStopped);
    }
    return Err<proof::Solution>(
        ErrorCode::MiningExhausted,
        "Цель " + std::to_string(config.target_difficulty) + " бит не достигнута за " +
            std::to_string(impl_->attempts.load()) + " попыток"
    );
}

void Miner::stop() noexcept {
    impl_->stop_requested = true;
}

bool Miner::is_running() const noexcept {
    return impl_->running;
}

MinerStats Miner::stats() const {
    return impl_->snapshot();
}

const MinerConfig& Miner::config() const noexcept {
    return impl_->config;
}

// =============================================================================
// Проверка работы
// =============================================================================

Result<void> verify_work(
    const proof::Prover& prover,
    ByteSpan challenge,
    ByteSpan data,
    const proof::Solution& solution,
    uint32_t min_difficulty
) {
    auto verified = prover.verify(challenge, data, solution);
    if (!verified) {
        return verified;
    }

    uint32_t value = solution.difficulty();
    if (value < min_difficulty) {
        return Err<void>(
            ErrorCode::InsufficientDifficulty,
            "Сложность " + std::to_string(value) + " < " + std::to_string(min_difficulty)
        );
    }
    return {};
}

} // namespace segproof::mining
