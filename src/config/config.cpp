#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace desk {

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"starting_balance", c.starting_balance},
        {"payout_percent", c.payout_percent},
        {"default_duration_seconds", c.default_duration_seconds},
        {"default_pairs", c.default_pairs}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("starting_balance")) j.at("starting_balance").get_to(c.starting_balance);
    if (j.contains("payout_percent")) j.at("payout_percent").get_to(c.payout_percent);
    if (j.contains("default_duration_seconds")) j.at("default_duration_seconds").get_to(c.default_duration_seconds);
    if (j.contains("default_pairs")) j.at("default_pairs").get_to(c.default_pairs);
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = nlohmann::json{
        {"backend", c.backend},
        {"path", c.path},
        {"max_backups", c.max_backups}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("path")) j.at("path").get_to(c.path);
    if (j.contains("max_backups")) j.at("max_backups").get_to(c.max_backups);
}

void to_json(nlohmann::json& j, const SeedConfig& c) {
    j = nlohmann::json{
        {"mode", c.mode},
        {"min_seed", c.min_seed},
        {"max_seed", c.max_seed}
    };
}

void from_json(const nlohmann::json& j, SeedConfig& c) {
    if (j.contains("mode")) j.at("mode").get_to(c.mode);
    if (j.contains("min_seed")) j.at("min_seed").get_to(c.min_seed);
    if (j.contains("max_seed")) j.at("max_seed").get_to(c.max_seed);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"engine", c.engine},
        {"storage", c.storage},
        {"seeds", c.seeds},
        {"logging", c.logging},
        {"trade_ledger_path", c.trade_ledger_path},
        {"sweep_interval_ms", c.sweep_interval_ms}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("engine")) j.at("engine").get_to(c.engine);
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("seeds")) j.at("seeds").get_to(c.seeds);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("trade_ledger_path")) j.at("trade_ledger_path").get_to(c.trade_ledger_path);
    if (j.contains("sweep_interval_ms")) j.at("sweep_interval_ms").get_to(c.sweep_interval_ms);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (engine.starting_balance < 0) {
        spdlog::error("starting_balance must be non-negative");
        return false;
    }

    if (engine.payout_percent < 0) {
        spdlog::error("payout_percent must be non-negative");
        return false;
    }

    if (engine.payout_percent > 1000) {
        spdlog::warn("payout_percent of {} pays more than 10x the stake", engine.payout_percent);
    }

    if (engine.default_duration_seconds <= 0) {
        spdlog::error("default_duration_seconds must be positive");
        return false;
    }

    if (storage.backend != "json" && storage.backend != "sqlite" && storage.backend != "memory") {
        spdlog::error("Unknown storage backend: {}", storage.backend);
        return false;
    }

    if (storage.backend != "memory" && storage.path.empty()) {
        spdlog::error("storage.path is required for the {} backend", storage.backend);
        return false;
    }

    if (seeds.mode != "hash" && seeds.mode != "random") {
        spdlog::error("Unknown seed mode: {}", seeds.mode);
        return false;
    }

    if (seeds.min_seed > seeds.max_seed) {
        spdlog::error("min_seed must not exceed max_seed");
        return false;
    }

    if (sweep_interval_ms <= 0) {
        spdlog::error("sweep_interval_ms must be positive");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace desk
