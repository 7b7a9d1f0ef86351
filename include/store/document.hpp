#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/money.hpp"

namespace desk {

/**
 * A single binary-option trade. Created unsettled; settles exactly once.
 */
struct Trade {
    std::string trade_id;
    std::string pair;
    Side side{Side::BUY};
    Money amount;
    EpochSeconds placed_at{0.0};
    EpochSeconds expires_at{0.0};

    // Settlement (fixed once settled)
    bool settled{false};
    std::optional<Price> exit_price;
    std::optional<TradeResult> result;
    std::optional<EpochSeconds> settled_at;
    Money payout;

    bool is_expired(EpochSeconds now) const { return now >= expires_at; }
};

struct UserAccount {
    Money balance;
    std::vector<Trade> trades;

    Trade* find_trade(const std::string& trade_id);
    const Trade* find_trade(const std::string& trade_id) const;
};

/**
 * Whole persisted state: every user plus the pair seed registry.
 */
struct StoreDocument {
    std::map<std::string, UserAccount> users;
    std::map<std::string, int64_t> pair_seeds;

    // Empty string when valid
    std::string validation_error() const;
    bool is_valid() const { return validation_error().empty(); }
};

// JSON serialization
void to_json(nlohmann::json& j, const Trade& t);
void from_json(const nlohmann::json& j, Trade& t);
void to_json(nlohmann::json& j, const UserAccount& u);
void from_json(const nlohmann::json& j, UserAccount& u);
void to_json(nlohmann::json& j, const StoreDocument& d);
void from_json(const nlohmann::json& j, StoreDocument& d);

} // namespace desk
