#include <gtest/gtest.h>
#include "config/config.hpp"
#include "utils/ids.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace desk;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_optiondesk_config_" + generate_uuid() + ".json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& text) {
        std::ofstream file(path_);
        file << text;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_DOUBLE_EQ(config.engine.starting_balance, 1000.0);
    EXPECT_EQ(config.engine.payout_percent, 95);
    EXPECT_EQ(config.engine.default_duration_seconds, 60);
    EXPECT_EQ(config.engine.default_pairs.size(), 11u);
    EXPECT_EQ(config.storage.backend, "json");
    EXPECT_EQ(config.seeds.mode, "hash");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    write(R"({"storage": {"backend": "sqlite", "path": "/tmp/x.db"}, "seeds": {"mode": "random"}})");

    auto config = Config::load(path_);
    EXPECT_EQ(config.storage.backend, "sqlite");
    EXPECT_EQ(config.storage.path, "/tmp/x.db");
    EXPECT_EQ(config.storage.max_backups, 3);
    EXPECT_EQ(config.seeds.mode, "random");
    EXPECT_EQ(config.seeds.max_seed, 99999);
    EXPECT_EQ(config.sweep_interval_ms, 1000);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    Config config;
    config.engine.payout_percent = 80;
    config.engine.default_pairs = {"EUR/USD"};
    config.logging.log_level = "debug";
    config.trade_ledger_path = "/tmp/ledger.jsonl";
    config.save(path_);

    auto loaded = Config::load(path_);
    EXPECT_EQ(loaded.engine.payout_percent, 80);
    EXPECT_EQ(loaded.engine.default_pairs, std::vector<std::string>{"EUR/USD"});
    EXPECT_EQ(loaded.logging.log_level, "debug");
    EXPECT_EQ(loaded.trade_ledger_path, "/tmp/ledger.jsonl");
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config backend;
    backend.storage.backend = "mongo";
    EXPECT_FALSE(backend.validate());

    Config seeds;
    seeds.seeds.min_seed = 10;
    seeds.seeds.max_seed = 5;
    EXPECT_FALSE(seeds.validate());

    Config mode;
    mode.seeds.mode = "sequential";
    EXPECT_FALSE(mode.validate());

    Config interval;
    interval.sweep_interval_ms = 0;
    EXPECT_FALSE(interval.validate());

    Config duration;
    duration.engine.default_duration_seconds = 0;
    EXPECT_FALSE(duration.validate());

    Config balance;
    balance.engine.starting_balance = -1.0;
    EXPECT_FALSE(balance.validate());

    Config memory;
    memory.storage.backend = "memory";
    memory.storage.path.clear();
    EXPECT_TRUE(memory.validate());
}

TEST_F(ConfigTest, LoadThrowsOnMissingOrInvalidFile) {
    EXPECT_THROW(Config::load(path_), std::runtime_error);

    write(R"({"storage": {"backend": "mongo"}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, GetEnvFallsBackToDefault) {
    EXPECT_EQ(Config::get_env("OPTIONDESK_TEST_UNSET_" + generate_uuid(), "fallback"), "fallback");
}
