#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace desk {

struct EngineConfig {
    double starting_balance{1000.0};         // Balance given to a new user
    int payout_percent{95};                  // Win credits stake + 95% profit
    int default_duration_seconds{60};        // Used when a request omits duration

    // Pairs registered on every user-state request
    std::vector<std::string> default_pairs{
        "EUR/USD", "GBP/USD", "USD/JPY", "USD/CHF", "AUD/USD", "BTC/USD",
        "ETH/USD", "XRP/USD", "LTC/USD", "NZD/USD", "EUR/GBP"
    };
};

struct StorageConfig {
    std::string backend{"json"};             // json, sqlite, memory
    std::string path{"./data/data.json"};
    int max_backups{3};                      // json backend only
};

struct SeedConfig {
    std::string mode{"hash"};                // hash (deterministic) or random
    int64_t min_seed{1};
    int64_t max_seed{99999};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{20};
    int max_log_files{5};
};

struct Config {
    EngineConfig engine;
    StorageConfig storage;
    SeedConfig seeds;
    LoggingConfig logging;

    std::string trade_ledger_path{"./data/ledger.jsonl"};
    int sweep_interval_ms{1000};             // Background sweep period in serve mode

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace desk
