#include "store/document.hpp"
#include <algorithm>
#include <stdexcept>

namespace desk {

namespace {

// Payout rate of documents that predate the stored payout field
constexpr int64_t LEGACY_PAYOUT_PERCENT = 95;

} // namespace

Trade* UserAccount::find_trade(const std::string& trade_id) {
    auto it = std::find_if(trades.begin(), trades.end(),
                           [&](const Trade& t) { return t.trade_id == trade_id; });
    return it != trades.end() ? &*it : nullptr;
}

const Trade* UserAccount::find_trade(const std::string& trade_id) const {
    auto it = std::find_if(trades.begin(), trades.end(),
                           [&](const Trade& t) { return t.trade_id == trade_id; });
    return it != trades.end() ? &*it : nullptr;
}

std::string StoreDocument::validation_error() const {
    for (const auto& [username, user] : users) {
        if (username.empty()) {
            return "Empty username";
        }
        if (user.balance.is_negative()) {
            return "Negative balance for user " + username;
        }
        for (const auto& trade : user.trades) {
            if (!trade.amount.is_positive()) {
                return "Non-positive stake on trade " + trade.trade_id;
            }
            if (trade.expires_at <= trade.placed_at) {
                return "Trade expires before it was placed: " + trade.trade_id;
            }
            if (trade.settled && (!trade.result || !trade.exit_price)) {
                return "Settled trade missing outcome: " + trade.trade_id;
            }
        }
    }
    return "";
}

// JSON serialization implementations
void to_json(nlohmann::json& j, const Trade& t) {
    j = nlohmann::json{
        {"trade_id", t.trade_id},
        {"pair", t.pair},
        {"side", side_to_string(t.side)},
        {"amount", t.amount},
        {"placed_at", t.placed_at},
        {"expires_at", t.expires_at},
        {"settled", t.settled}
    };

    if (t.exit_price) j["exit_price"] = *t.exit_price;
    if (t.result) j["result"] = result_to_string(*t.result);
    if (t.settled_at) j["settled_at"] = *t.settled_at;
    if (t.settled) j["payout"] = t.payout;
}

void from_json(const nlohmann::json& j, Trade& t) {
    j.at("trade_id").get_to(t.trade_id);
    j.at("pair").get_to(t.pair);

    auto side = side_from_string(j.at("side").get<std::string>());
    if (!side) {
        throw std::invalid_argument("Invalid side on trade " + t.trade_id);
    }
    t.side = *side;

    j.at("amount").get_to(t.amount);
    j.at("placed_at").get_to(t.placed_at);
    j.at("expires_at").get_to(t.expires_at);
    t.settled = j.value("settled", false);

    if (j.contains("exit_price") && !j["exit_price"].is_null()) {
        t.exit_price = j["exit_price"].get<double>();
    }
    if (j.contains("result") && !j["result"].is_null()) {
        t.result = result_from_string(j["result"].get<std::string>());
    }
    if (j.contains("settled_at") && !j["settled_at"].is_null()) {
        t.settled_at = j["settled_at"].get<double>();
    }
    if (j.contains("payout") && !j["payout"].is_null()) {
        j["payout"].get_to(t.payout);
    } else if (t.settled && t.result == TradeResult::WIN) {
        // Documents written before payouts were recorded
        t.payout = t.amount.scaled(100 + LEGACY_PAYOUT_PERCENT, 100);
    }
}

void to_json(nlohmann::json& j, const UserAccount& u) {
    j = nlohmann::json{
        {"balance", u.balance},
        {"trades", u.trades}
    };
}

void from_json(const nlohmann::json& j, UserAccount& u) {
    j.at("balance").get_to(u.balance);
    if (j.contains("trades")) {
        u.trades = j["trades"].get<std::vector<Trade>>();
    }
}

void to_json(nlohmann::json& j, const StoreDocument& d) {
    j = nlohmann::json{
        {"users", d.users},
        {"pair_seeds", d.pair_seeds}
    };
}

void from_json(const nlohmann::json& j, StoreDocument& d) {
    if (j.contains("users")) {
        d.users = j["users"].get<std::map<std::string, UserAccount>>();
    }
    if (j.contains("pair_seeds")) {
        d.pair_seeds = j["pair_seeds"].get<std::map<std::string, int64_t>>();
    }
}

} // namespace desk
