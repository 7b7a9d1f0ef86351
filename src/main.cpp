#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/document_store.hpp"
#include "persistence/json_file_store.hpp"
#include "persistence/sqlite_store.hpp"
#include "persistence/trade_ledger.hpp"
#include "store/trade_store.hpp"
#include "engine/trade_engine.hpp"
#include "engine/settlement_sweeper.hpp"
#include "api/command_surface.hpp"

using namespace desk;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

// Console logs go to stderr: stdout carries only JSON responses
void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/optiondesk.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("optiondesk", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

std::shared_ptr<DocumentStore> make_backend(const StorageConfig& storage) {
    if (storage.backend == "sqlite") {
        return std::make_shared<SqliteDocumentStore>(storage.path);
    }
    if (storage.backend == "memory") {
        return std::make_shared<MemoryDocumentStore>();
    }

    JsonFileStore::Config json_config;
    json_config.path = storage.path;
    json_config.max_backups = storage.max_backups;
    return std::make_shared<JsonFileStore>(json_config);
}

SeedSource make_seed_source(const SeedConfig& seeds) {
    if (seeds.mode == "random") {
        return make_random_seed_source(seeds.min_seed, seeds.max_seed);
    }
    return make_hash_seed_source();
}

int print_response(const nlohmann::json& response) {
    std::cout << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return response.value("ok", false) ? 0 : 1;
}

int run_serve(CommandSurface& surface, const std::shared_ptr<TradeEngine>& engine,
              const Config& config) {
    if (!engine->register_pairs(config.engine.default_pairs)) {
        spdlog::warn("Could not register default pairs at startup");
    }

    SettlementSweeper sweeper(engine, std::chrono::milliseconds(config.sweep_interval_ms));
    sweeper.start();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Serving JSON requests on stdin");

    std::string line;
    while (!g_shutdown.load() && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        std::cout << surface.handle_line(line) << std::endl;
    }

    sweeper.stop();
    spdlog::info("Shutdown complete: opened={}, settled={}, rejected={}",
                 engine->trades_opened(), engine->trades_settled(), engine->trades_rejected());
    return 0;
}

int main(int argc, char* argv[]) {
    // CLI parsing
    CLI::App app{"OptionDesk - simulated binary options trading backend"};

    std::string config_path = "configs/optiondesk.json";
    std::string data_path;
    std::string backend;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--data", data_path, "Store path (overrides config and OPTIONDESK_DATA)");
    app.add_option("--backend", backend, "Store backend: json, sqlite, memory")
        ->check(CLI::IsMember({"json", "sqlite", "memory"}));
    app.add_flag("-v,--version", show_version, "Show version information");
    app.require_subcommand(0, 1);

    std::string user;
    std::string pair;
    std::string side;
    std::string amount;
    std::string trade_id;
    int64_t duration = 0;
    double ts = 0.0;
    double start = 0.0;
    double end = 0.0;
    double step = 1.0;
    int64_t limit = 0;

    auto* state_cmd = app.add_subcommand("state", "Show balance, active trades and pair seeds");
    state_cmd->add_option("-u,--user", user, "Username")->required();

    auto* open_cmd = app.add_subcommand("open", "Open a trade");
    open_cmd->add_option("-u,--user", user, "Username")->required();
    open_cmd->add_option("-p,--pair", pair, "Pair symbol, e.g. EUR/USD")->required();
    open_cmd->add_option("-s,--side", side, "buy or sell")->required();
    open_cmd->add_option("-a,--amount", amount, "Stake")->required();
    auto* duration_opt = open_cmd->add_option("-d,--duration", duration, "Seconds until expiry");

    auto* settle_cmd = app.add_subcommand("settle", "Settle expired trades and show one trade");
    settle_cmd->add_option("-u,--user", user, "Username")->required();
    settle_cmd->add_option("-t,--trade", trade_id, "Trade id")->required();

    auto* price_cmd = app.add_subcommand("price", "Oracle price for a pair");
    price_cmd->add_option("-p,--pair", pair, "Pair symbol (default EUR/USD)");
    auto* ts_opt = price_cmd->add_option("--ts", ts, "Unix timestamp (default now)");

    auto* history_cmd = app.add_subcommand("history", "Settled trades, newest first");
    history_cmd->add_option("-u,--user", user, "Username")->required();
    history_cmd->add_option("-n,--limit", limit, "Maximum trades to list (0 = all)");

    auto* series_cmd = app.add_subcommand("series", "Oracle price series for a pair");
    series_cmd->add_option("-p,--pair", pair, "Pair symbol")->required();
    series_cmd->add_option("--start", start, "First timestamp")->required();
    series_cmd->add_option("--end", end, "Last timestamp")->required();
    series_cmd->add_option("--step", step, "Seconds between samples");

    auto* sweep_cmd = app.add_subcommand("sweep", "Settle every expired trade");
    auto* serve_cmd = app.add_subcommand("serve", "Answer JSON requests from stdin, one per line");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "OptionDesk v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    if (app.get_subcommands().empty()) {
        std::cout << app.help();
        return 1;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        std::cerr << "Using default configuration.\n";
    }

    // Environment, then command line
    config.storage.path = Config::get_env("OPTIONDESK_DATA", config.storage.path);
    config.storage.backend = Config::get_env("OPTIONDESK_BACKEND", config.storage.backend);
    if (!data_path.empty()) config.storage.path = data_path;
    if (!backend.empty()) config.storage.backend = backend;

    // Setup logging
    setup_logging(config.logging);

    if (!config.validate()) {
        return print_response(CommandSurface::error_response("invalid configuration"));
    }

    // Initialize components
    std::shared_ptr<TradeStore> store;
    try {
        store = std::make_shared<TradeStore>(make_backend(config.storage),
                                             make_seed_source(config.seeds));
    } catch (const StoreError& e) {
        spdlog::error("Failed to open store {}: {}", config.storage.path, e.what());
        return print_response(CommandSurface::error_response("store unavailable"));
    }

    auto engine = std::make_shared<TradeEngine>(store, config.engine);

    // Trade ledger
    std::shared_ptr<TradeLedger> trade_ledger;
    if (!config.trade_ledger_path.empty()) {
        trade_ledger = std::make_shared<TradeLedger>(config.trade_ledger_path);
        engine->set_open_callback([trade_ledger](const std::string& user_id, const Trade& trade) {
            trade_ledger->record_open(user_id, trade);
        });
        engine->set_settlement_callback([trade_ledger](const std::string& user_id, const Trade& trade) {
            trade_ledger->record_settlement(user_id, trade);
        });
    }

    CommandSurface surface(engine);

    if (state_cmd->parsed()) {
        return print_response(surface.get_user_state({{"username", user}}));
    }

    if (open_cmd->parsed()) {
        nlohmann::json request{
            {"username", user}, {"pair", pair}, {"side", side}, {"amount", amount}
        };
        if (duration_opt->count() > 0) request["duration"] = duration;
        return print_response(surface.open_trade(request));
    }

    if (settle_cmd->parsed()) {
        return print_response(surface.settle_trade({{"username", user}, {"trade_id", trade_id}}));
    }

    if (price_cmd->parsed()) {
        nlohmann::json request = nlohmann::json::object();
        if (!pair.empty()) request["pair"] = pair;
        if (ts_opt->count() > 0) request["ts"] = ts;
        return print_response(surface.price_at(request));
    }

    if (history_cmd->parsed()) {
        return print_response(surface.trade_history({{"username", user}, {"limit", limit}}));
    }

    if (series_cmd->parsed()) {
        return print_response(surface.price_series(
            {{"pair", pair}, {"start", start}, {"end", end}, {"step", step}}));
    }

    if (sweep_cmd->parsed()) {
        SettlementSweeper sweeper(engine, std::chrono::milliseconds(config.sweep_interval_ms));
        auto report = sweeper.sweep_now();
        if (!report.ok) {
            return print_response(CommandSurface::error_response("store unavailable"));
        }
        return print_response({
            {"ok", true},
            {"settled", report.settled},
            {"wins", report.wins},
            {"losses", report.losses},
            {"credited", report.credited.to_double()}
        });
    }

    if (serve_cmd->parsed()) {
        return run_serve(surface, engine, config);
    }

    return 1;
}
