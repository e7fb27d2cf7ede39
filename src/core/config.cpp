/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 * 
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "hex.hpp"
#include "../mining/nonce_distributor.hpp"
#include "../proof/prover.hpp"

#include <toml++/toml.hpp>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <vector>

namespace segproof {

namespace {

/**
 * @brief Прочитать неотрицательное целое из таблицы
 * 
 * @param max Наибольшее допустимое значение (ширина поля назначения)
 * @return nullopt если ключ отсутствует, ошибка если значение отрицательное
 *         или не помещается в поле
 */
Result<std::optional<uint64_t>> read_unsigned(
    const toml::table& table,
    std::string_view section,
    std::string_view key,
    uint64_t max = std::numeric_limits<uint64_t>::max()
) {
    auto val = table[key].value<int64_t>();
    if (!val) {
        return std::optional<uint64_t>{};
    }
    if (*val < 0) {
        return Err<std::optional<uint64_t>>(
            ErrorCode::ConfigInvalidValue,
            std::string(section) + "." + std::string(key) + " не может быть отрицательным"
        );
    }
    if (static_cast<uint64_t>(*val) > max) {
        return Err<std::optional<uint64_t>>(
            ErrorCode::ConfigInvalidValue,
            std::string(section) + "." + std::string(key) + " превышает " + std::to_string(max)
        );
    }
    return std::optional<uint64_t>{static_cast<uint64_t>(*val)};
}

} // anonymous namespace

// =============================================================================
// JobConfig
// =============================================================================

Result<Challenge> JobConfig::parse_challenge() const {
    auto parsed = from_hex_fixed<constants::CHALLENGE_SIZE>(challenge);
    if (!parsed) {
        return Err<Challenge>(
            ErrorCode::ConfigInvalidValue,
            "job.challenge должен содержать " +
                std::to_string(constants::CHALLENGE_SIZE * 2) + " hex символа: " +
                parsed.error().message
        );
    }
    return *parsed;
}

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            "Файл конфигурации не найден: " + path.string()
        );
    }
    
    try {
        // Парсим TOML файл
        auto table = toml::parse_file(path.string());
        
        Config config;
        
        // === Секция [proof] ===
        if (auto proof = table["proof"].as_table()) {
            auto val = read_unsigned(*proof, "proof", "segment_size",
                                     std::numeric_limits<std::size_t>::max());
            if (!val) return std::unexpected(val.error());
            if (*val) config.proof.segment_size = static_cast<std::size_t>(**val);
            
            if (auto sel = (*proof)["selection"].value<std::string>()) {
                config.proof.selection = *sel;
            }
        }
        
        // === Секция [puzzle] ===
        if (auto puzzle = table["puzzle"].as_table()) {
            if (auto val = (*puzzle)["compile"].value<bool>()) {
                config.puzzle.compile = *val;
            }
            if (auto val = (*puzzle)["huge_pages"].value<bool>()) {
                config.puzzle.huge_pages = *val;
            }
        }
        
        // === Секция [mining] ===
        if (auto mining = table["mining"].as_table()) {
            auto target = read_unsigned(*mining, "mining", "target_difficulty", std::numeric_limits<uint32_t>::max());
            if (!target) return std::unexpected(target.error());
            if (*target) config.mining.target_difficulty = static_cast<uint32_t>(**target);
            
            auto workers = read_unsigned(*mining, "mining", "workers", std::numeric_limits<uint32_t>::max());
            if (!workers) return std::unexpected(workers.error());
            if (*workers) config.mining.workers = static_cast<uint32_t>(**workers);
            
            auto start = read_unsigned(*mining, "mining", "start_nonce");
            if (!start) return std::unexpected(start.error());
            if (*start) config.mining.start_nonce = **start;
            
            auto attempts = read_unsigned(*mining, "mining", "max_attempts");
            if (!attempts) return std::unexpected(attempts.error());
            if (*attempts) config.mining.max_attempts = **attempts;
            
            if (auto val = (*mining)["strategy"].value<std::string>()) {
                config.mining.strategy = *val;
            }
        }
        
        // === Секция [job] ===
        if (auto job = table["job"].as_table()) {
            if (auto val = (*job)["challenge"].value<std::string>()) {
                config.job.challenge = *val;
            }
            if (auto val = (*job)["segment_path"].value<std::string>()) {
                config.job.segment_path = *val;
            }
        }
        
        // === Секция [logging] ===
        if (auto logging = table["logging"].as_table()) {
            if (auto val = (*logging)["level"].value<std::string>()) {
                config.logging.level = *val;
            }
            
            auto refresh = read_unsigned(*logging, "logging", "refresh_interval_ms",
                                         std::numeric_limits<uint32_t>::max());
            if (!refresh) return std::unexpected(refresh.error());
            if (*refresh) config.logging.refresh_interval_ms = static_cast<uint32_t>(**refresh);
            
            auto history = read_unsigned(*logging, "logging", "event_history",
                                         std::numeric_limits<std::size_t>::max());
            if (!history) return std::unexpected(history.error());
            if (*history) config.logging.event_history = static_cast<std::size_t>(**history);
            
            if (auto val = (*logging)["color"].value<bool>()) {
                config.logging.color = *val;
            }
        }
        
        return config;
        
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << "Ошибка парсинга TOML: " << e.description() << " (" << e.source().begin << ")";
        return Err<Config>(ErrorCode::ConfigParseError, msg.str());
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь должен существовать
    if (path) {
        return load(*path);
    }
    
    // Список путей для поиска
    std::vector<std::filesystem::path> search_paths = {
        "segproof.toml",
        "/etc/segproof/segproof.toml",
    };
    
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "segproof" / "segproof.toml"
        );
    }
    
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }
    
    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (proof.segment_size == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "proof.segment_size должен быть больше 0"
        );
    }
    
    if (!proof::selection_from_string(proof.selection)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "proof.selection должен быть 'lowest_digest' или 'first_found'"
        );
    }
    
    if (mining.target_difficulty > constants::MAX_DIFFICULTY) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "mining.target_difficulty не может превышать " +
                std::to_string(constants::MAX_DIFFICULTY)
        );
    }
    
    if (mining.workers == 0 || mining.workers > constants::MAX_WORKERS) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "mining.workers должен быть в диапазоне 1-" + std::to_string(constants::MAX_WORKERS)
        );
    }
    
    if (!mining::strategy_from_string(mining.strategy)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "mining.strategy должен быть 'sequential' или 'interleaved'"
        );
    }
    
    if (!job.challenge.empty()) {
        if (auto parsed = job.parse_challenge(); !parsed) {
            return std::unexpected(parsed.error());
        }
    }
    
    if (!log::level_from_string(logging.level)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'error', 'warn', 'info' или 'debug'"
        );
    }
    
    if (logging.event_history == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.event_history должен быть больше 0"
        );
    }
    
    return {};
}

} // namespace segproof
