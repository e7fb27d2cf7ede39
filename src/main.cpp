/**
 * @file main.cpp
 * @brief Точка входа segproof-miner
 * 
 * segproof-miner доказывает хранение сегмента данных: перебирает nonce,
 * решает memory-hard головоломку для seed = challenge || data || nonce
 * и выводит запись решения, достигшую целевой сложности.
 * 
 * Основные компоненты:
 * 1. Config - загрузка segproof.toml
 * 2. EquixSolver - решатель головоломки
 * 3. Prover - solve/verify одного nonce
 * 4. Miner - многопоточный перебор nonce
 * 5. StatusReporter - терминальный вывод статуса
 * 
 * Использование:
 *   segproof-miner [options]
 * 
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "log/status_reporter.hpp"
#include "mining/miner.hpp"
#include "proof/prover.hpp"
#include "proof/solution.hpp"
#include "puzzle/puzzle_solver.hpp"

#ifdef SEGPROOF_HAS_EQUIX
#include "puzzle/equix_solver.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
segproof-miner v)" << VERSION << R"(
Доказательство доступа к сегменту данных через memory-hard головоломку

ИСПОЛЬЗОВАНИЕ:
    segproof-miner [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH      Путь к файлу конфигурации (segproof.toml)
    -h, --help             Показать эту справку
    -v, --version          Показать версию программы
    --test-config          Проверить конфигурацию и выйти
    --challenge HEX        Challenge (64 hex символа), заменяет job.challenge
    --segment PATH         Файл сегмента, заменяет job.segment_path
    --verify RECORD        Проверить запись решения (80 hex символов) и выйти

ПРИМЕРЫ:
    segproof-miner -c /etc/segproof/segproof.toml
    segproof-miner --challenge 00..00 --segment segment.bin
    segproof-miner --segment segment.bin --verify 9fd5...

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "segproof-miner v" << VERSION << std::endl;
#ifdef SEGPROOF_HAS_EQUIX
    std::cout << "Puzzle: equix" << std::endl;
#else
    std::cout << "Puzzle: (not built)" << std::endl;
#endif
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> challenge;
    std::optional<std::string> segment_path;
    std::optional<std::string> verify_record;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;
    
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        
        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--challenge" && i + 1 < argc) {
            args.challenge = argv[++i];
        } else if (arg == "--segment" && i + 1 < argc) {
            args.segment_path = argv[++i];
        } else if (arg == "--verify" && i + 1 < argc) {
            args.verify_record = argv[++i];
        }
    }
    
    return args;
}

/**
 * @brief Прочитать сегмент данных из файла
 */
segproof::Result<segproof::Bytes> read_segment(const std::string& path) {
    using namespace segproof;
    
    if (path.empty()) {
        return Err<Bytes>(ErrorCode::ConfigInvalidValue, "Не указан файл сегмента (job.segment_path)");
    }
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<Bytes>(ErrorCode::SystemIOError, "Не удалось открыть сегмент: " + path);
    }
    
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<Bytes>(ErrorCode::SystemIOError, "Ошибка чтения сегмента: " + path);
    }
    return data;
}

/**
 * @brief Создать решатель головоломки
 */
segproof::Result<std::unique_ptr<segproof::puzzle::PuzzleSolver>> make_solver(
    const segproof::PuzzleConfig& config
) {
    using namespace segproof;
    
#ifdef SEGPROOF_HAS_EQUIX
    puzzle::EquixOptions options;
    options.try_compile = config.compile;
    options.huge_pages = config.huge_pages;
    return std::unique_ptr<puzzle::PuzzleSolver>(
        std::make_unique<puzzle::EquixSolver>(options)
    );
#else
    (void)config;
    return Err<std::unique_ptr<puzzle::PuzzleSolver>>(
        ErrorCode::PuzzleFailure,
        "segproof-miner собран без EquiX (SEGPROOF_WITH_EQUIX)"
    );
#endif
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace segproof;
    
    // Парсим аргументы
    auto args = parse_args(argc, argv);
    
    if (args.show_help) {
        print_help();
        return 0;
    }
    
    if (args.show_version) {
        print_version();
        return 0;
    }
    
    // Загружаем конфигурацию
    std::cout << "[INFO] Загрузка конфигурации..." << std::endl;
    
    auto config_result = args.config_path 
        ? Config::load(*args.config_path)
        : Config::load_with_search();
    
    Config config;
    if (config_result) {
        config = *config_result;
    } else if (config_result.error().code == ErrorCode::ConfigNotFound && !args.config_path) {
        std::cerr << "[WARNING] " << config_result.error().message
                  << ", используются значения по умолчанию" << std::endl;
    } else {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }
    
    if (args.challenge) {
        config.job.challenge = *args.challenge;
    }
    if (args.segment_path) {
        config.job.segment_path = *args.segment_path;
    }
    
    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: " 
                  << validation.error().message << std::endl;
        return 1;
    }
    
    std::cout << "[INFO] Конфигурация загружена успешно" << std::endl;
    
    if (args.test_config) {
        std::cout << "[INFO] Конфигурация валидна" << std::endl;
        return 0;
    }
    
    // Задание
    auto challenge = config.job.parse_challenge();
    if (!challenge) {
        std::cerr << "[ERROR] " << challenge.error().message << std::endl;
        return 1;
    }
    
    auto segment = read_segment(config.job.segment_path);
    if (!segment) {
        std::cerr << "[ERROR] " << segment.error().message << std::endl;
        return 1;
    }
    
    std::cout << "[INFO] Сегмент: " << config.job.segment_path
              << " (" << segment->size() << " байт)" << std::endl;
    
    // Решатель и прувер
    auto solver = make_solver(config.puzzle);
    if (!solver) {
        std::cerr << "[ERROR] " << solver.error().message << std::endl;
        return 1;
    }
    
    proof::ProofParams params;
    params.segment_size = config.proof.segment_size;
    auto policy = proof::selection_from_string(config.proof.selection)
        .value_or(proof::SelectionPolicy::LowestDigest);
    proof::Prover prover(**solver, params, policy);
    
    std::cout << "[INFO] Решатель: " << (*solver)->name()
              << ", политика выбора: " << proof::to_string(policy) << std::endl;
    
    log::StatusReporter status_reporter(config.logging);
    
    // === Режим проверки ===
    if (args.verify_record) {
        auto record = from_hex(*args.verify_record);
        if (!record) {
            std::cerr << "[ERROR] " << record.error().message << std::endl;
            return 1;
        }
        
        auto solution = proof::Solution::from_bytes(*record);
        if (!solution) {
            std::cerr << "[ERROR] " << solution.error().message << std::endl;
            return 1;
        }
        
        auto verified = mining::verify_work(
            prover, *challenge, *segment, *solution, config.mining.target_difficulty
        );
        if (!verified) {
            status_reporter.log_verify(false, verified.error().message);
            std::cerr << "[ERROR] Доказательство отклонено: "
                      << verified.error().message << std::endl;
            return 1;
        }
        
        status_reporter.log_verify(true);
        std::cout << "[INFO] Доказательство принято, сложность "
                  << solution->difficulty() << " бит" << std::endl;
        return 0;
    }
    
    // === Режим майнинга ===
    mining::MinerConfig miner_config;
    miner_config.target_difficulty = config.mining.target_difficulty;
    miner_config.workers = config.mining.workers;
    miner_config.start_nonce = config.mining.start_nonce;
    miner_config.max_attempts = config.mining.max_attempts;
    miner_config.strategy = mining::strategy_from_string(config.mining.strategy)
        .value_or(mining::NonceStrategy::Interleaved);
    
    mining::Miner miner(prover, miner_config, &status_reporter);
    
    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    
    std::atomic<bool> mining_done{false};
    std::thread signal_watcher([&]() {
        while (!mining_done.load(std::memory_order_relaxed)) {
            if (!g_running.load(std::memory_order_relaxed)) {
                std::cout << "\n[INFO] Получен сигнал завершения, останавливаем..." << std::endl;
                miner.stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
    
    std::cout << "[INFO] Начинаем майнинг: цель " << miner_config.target_difficulty
              << " бит, потоков " << miner_config.workers << std::endl;
    
    status_reporter.start();
    auto result = miner.mine(*challenge, *segment);
    status_reporter.stop();
    
    mining_done = true;
    signal_watcher.join();
    
    // Выводим финальную статистику
    auto stats = miner.stats();
    std::cout << "\n=== Итоговая статистика ===" << std::endl;
    std::cout << "Время работы: " << stats.elapsed.count() << " мс" << std::endl;
    std::cout << "Попыток: " << stats.attempts << std::endl;
    std::cout << "Без решения: " << stats.no_solution << std::endl;
    std::cout << "Лучшая сложность: " << stats.best_difficulty << " бит" << std::endl;
    
    if (!result) {
        std::cerr << "[ERROR] " << result.error().message << std::endl;
        return 1;
    }
    
    // Самопроверка перед выводом
    auto verified = prover.verify(*challenge, *segment, *result);
    if (!verified) {
        std::cerr << "[ERROR] Самопроверка не пройдена: " << verified.error().message << std::endl;
        return 1;
    }
    
    auto record = result->to_bytes();
    std::cout << "[INFO] Nonce: " << to_hex(result->nonce) << std::endl;
    std::cout << "[INFO] Digest: " << to_hex(result->digest) << std::endl;
    std::cout << "[INFO] Сложность: " << result->difficulty() << " бит" << std::endl;
    std::cout << to_hex(record) << std::endl;
    
    return 0;
}
