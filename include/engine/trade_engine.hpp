#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <functional>
#include "common/types.hpp"
#include "common/money.hpp"
#include "config/config.hpp"
#include "oracle/price_oracle.hpp"
#include "store/document.hpp"
#include "store/trade_store.hpp"

namespace desk {

/**
 * Ok/error triple shared by every engine operation result.
 */
struct EngineStatus {
    bool ok{true};
    ErrorCode error{ErrorCode::NONE};
    std::string message;

    void fail(ErrorCode code, std::string msg) {
        ok = false;
        error = code;
        message = std::move(msg);
    }
};

struct OpenTradeRequest {
    std::string user_id;
    std::string pair;
    Side side{Side::BUY};
    Money amount;
    int64_t duration_seconds{0};
};

struct OpenTradeResult : EngineStatus {
    std::string trade_id;
    Money new_balance;
};

struct SweepReport : EngineStatus {
    int settled{0};
    int wins{0};
    int losses{0};
    Money credited;
};

// Unsettled trade as shown to its owner
struct ActiveTrade {
    Trade trade;
    int64_t remaining_seconds{0};
    Price entry_price{0.0};
};

struct UserView : EngineStatus {
    Money balance;
    std::vector<ActiveTrade> active_trades;
    std::map<std::string, int64_t> pair_seeds;
};

struct TradeLookup : EngineStatus {
    Trade trade;
    Money balance;
};

struct TradeHistory : EngineStatus {
    Money balance;
    std::vector<Trade> trades;       // Settled only, newest first
    int wins{0};
    int losses{0};
};

struct PriceQuote {
    Price price{0.0};
    int64_t seed{0};
    bool assigned{false};            // false: pair has no stored seed yet
};

struct PriceSeries {
    int64_t seed{0};
    bool assigned{false};
    std::vector<oracle::PricePoint> points;
};

// Ties (exit == entry) lose for both sides
TradeResult decide_outcome(Side side, Price entry, Price exit);

/**
 * Trade lifecycle: opens trades against a user balance, settles them once
 * expired and answers account queries.
 *
 * Every operation that touches state runs inside TradeStore::mutate, so each
 * one is atomic with respect to the others. Expired trades are settled before
 * any read of the owner's state.
 */
class TradeEngine {
public:
    using PriceFn = oracle::PriceFn;
    using TradeCallback = std::function<void(const std::string& user_id, const Trade& trade)>;

    TradeEngine(std::shared_ptr<TradeStore> store,
                const EngineConfig& config,
                Clock clock = epoch_now,
                PriceFn price_fn = oracle::price_at);

    OpenTradeResult open_trade(const OpenTradeRequest& request);

    // Settle every expired trade of every user
    SweepReport settle_expired();

    // Creates the user on first sight and registers the default pairs
    UserView get_user_view(const std::string& user_id);

    TradeLookup lookup_trade(const std::string& user_id, const std::string& trade_id);

    // limit == 0 returns every settled trade
    TradeHistory trade_history(const std::string& user_id, size_t limit = 0);

    // Read-only: unknown pairs are priced with the hash seed and not recorded
    PriceQuote price_at(const std::string& pair, EpochSeconds ts) const;
    PriceSeries price_series(const std::string& pair, EpochSeconds start,
                             EpochSeconds end, EpochSeconds step) const;

    // Assign seeds up front; false if the store rejected the write
    bool register_pairs(const std::vector<std::string>& pairs);

    // Callbacks run after the change is committed, outside the store lock
    void set_open_callback(TradeCallback cb) { on_open_ = std::move(cb); }
    void set_settlement_callback(TradeCallback cb) { on_settle_ = std::move(cb); }

    // Stats
    int64_t trades_opened() const { return trades_opened_.load(); }
    int64_t trades_rejected() const { return trades_rejected_.load(); }
    int64_t trades_settled() const { return trades_settled_.load(); }
    int64_t wins() const { return wins_.load(); }
    int64_t losses() const { return losses_.load(); }

    const EngineConfig& config() const { return config_; }
    EpochSeconds now() const { return clock_(); }

private:
    std::shared_ptr<TradeStore> store_;
    EngineConfig config_;
    Money starting_balance_;
    Clock clock_;
    PriceFn price_fn_;

    TradeCallback on_open_;
    TradeCallback on_settle_;

    std::atomic<int64_t> trades_opened_{0};
    std::atomic<int64_t> trades_rejected_{0};
    std::atomic<int64_t> trades_settled_{0};
    std::atomic<int64_t> wins_{0};
    std::atomic<int64_t> losses_{0};

    struct SettledTrade {
        std::string user_id;
        Trade trade;
    };

    // Must run inside a store transaction
    void settle_in(StoreTransaction& tx, EpochSeconds now,
                   SweepReport& report, std::vector<SettledTrade>& settled);
    void publish_settlements(const SweepReport& report,
                             const std::vector<SettledTrade>& settled);
};

} // namespace desk
