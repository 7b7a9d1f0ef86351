#include "engine/trade_engine.hpp"
#include "utils/ids.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace desk {

TradeResult decide_outcome(Side side, Price entry, Price exit) {
    if (side == Side::BUY) {
        return exit > entry ? TradeResult::WIN : TradeResult::LOSS;
    }
    return exit < entry ? TradeResult::WIN : TradeResult::LOSS;
}

TradeEngine::TradeEngine(
    std::shared_ptr<TradeStore> store,
    const EngineConfig& config,
    Clock clock,
    PriceFn price_fn)
    : store_(std::move(store))
    , config_(config)
    , starting_balance_(Money::from_double(config.starting_balance))
    , clock_(std::move(clock))
    , price_fn_(std::move(price_fn))
{
    spdlog::info("TradeEngine initialized: starting balance {}, payout {}%",
                 starting_balance_.to_string(), config_.payout_percent);
}

OpenTradeResult TradeEngine::open_trade(const OpenTradeRequest& request) {
    OpenTradeResult result;

    if (request.user_id.empty() || request.pair.empty() ||
        !request.amount.is_positive() || request.duration_seconds <= 0) {
        result.fail(ErrorCode::INVALID_INPUT, "invalid payload");
        trades_rejected_++;
        return result;
    }

    // Expired wins are credited before the funds check
    auto sweep = settle_expired();
    if (!sweep.ok) {
        result.fail(ErrorCode::STORE_UNAVAILABLE, sweep.message);
        return result;
    }

    Trade trade;
    auto status = store_->mutate([&](StoreTransaction& tx) {
        UserAccount& user = tx.ensure_user(request.user_id, starting_balance_);
        if (user.balance < request.amount) {
            result.fail(ErrorCode::INSUFFICIENT_BALANCE, "insufficient balance");
            tx.rollback();
            return;
        }

        tx.seed_for(request.pair);

        EpochSeconds now = clock_();
        trade.trade_id = generate_uuid();
        trade.pair = request.pair;
        trade.side = request.side;
        trade.amount = request.amount;
        trade.placed_at = now;
        trade.expires_at = now + static_cast<double>(request.duration_seconds);

        user.balance -= request.amount;
        user.trades.push_back(trade);
        tx.mark_dirty();

        result.trade_id = trade.trade_id;
        result.new_balance = user.balance;
    });

    if (!status.ok) {
        result = OpenTradeResult{};
        result.fail(ErrorCode::STORE_UNAVAILABLE, status.error);
        return result;
    }

    if (!result.ok) {
        trades_rejected_++;
        spdlog::info("Trade rejected for {}: {} {} {} ({})",
                     request.user_id, side_to_string(request.side), request.amount.to_string(),
                     request.pair, result.message);
        return result;
    }

    trades_opened_++;
    spdlog::info("Trade opened: {} {} {} {} on {} for {}, balance {}",
                 trade.trade_id, request.user_id, side_to_string(trade.side),
                 trade.amount.to_string(), trade.pair,
                 time_utils::format_seconds(request.duration_seconds),
                 result.new_balance.to_string());

    if (on_open_) {
        on_open_(request.user_id, trade);
    }

    return result;
}

void TradeEngine::settle_in(StoreTransaction& tx, EpochSeconds now,
                            SweepReport& report, std::vector<SettledTrade>& settled) {
    for (auto& [user_id, user] : tx.document().users) {
        for (auto& trade : user.trades) {
            if (trade.settled || !trade.is_expired(now)) {
                continue;
            }

            int64_t seed = tx.seed_for(trade.pair);
            Price entry = price_fn_(seed, trade.placed_at);
            Price exit = price_fn_(seed, trade.expires_at);
            TradeResult outcome = decide_outcome(trade.side, entry, exit);

            Money payout;
            if (outcome == TradeResult::WIN) {
                payout = trade.amount.scaled(100 + config_.payout_percent, 100);
            }

            trade.settled = true;
            trade.exit_price = exit;
            trade.result = outcome;
            trade.settled_at = now;
            trade.payout = payout;
            user.balance += payout;
            tx.mark_dirty();

            report.settled++;
            report.credited += payout;
            if (outcome == TradeResult::WIN) {
                report.wins++;
            } else {
                report.losses++;
            }

            settled.push_back({user_id, trade});
        }
    }
}

void TradeEngine::publish_settlements(const SweepReport& report,
                                      const std::vector<SettledTrade>& settled) {
    if (settled.empty()) {
        return;
    }

    trades_settled_ += report.settled;
    wins_ += report.wins;
    losses_ += report.losses;

    for (const auto& s : settled) {
        spdlog::info("Trade settled: {} {} {} {} expired {} -> {} payout {}",
                     s.trade.trade_id, s.user_id, side_to_string(s.trade.side),
                     s.trade.pair, time_utils::to_iso8601(s.trade.expires_at),
                     result_to_string(*s.trade.result), s.trade.payout.to_string());
        if (on_settle_) {
            on_settle_(s.user_id, s.trade);
        }
    }
}

SweepReport TradeEngine::settle_expired() {
    SweepReport report;
    std::vector<SettledTrade> settled;

    auto status = store_->mutate([&](StoreTransaction& tx) {
        settle_in(tx, clock_(), report, settled);
    });

    if (!status.ok) {
        SweepReport failed;
        failed.fail(ErrorCode::STORE_UNAVAILABLE, status.error);
        return failed;
    }

    publish_settlements(report, settled);
    return report;
}

UserView TradeEngine::get_user_view(const std::string& user_id) {
    UserView view;
    if (user_id.empty()) {
        view.fail(ErrorCode::INVALID_INPUT, "missing username");
        return view;
    }

    SweepReport report;
    std::vector<SettledTrade> settled;

    auto status = store_->mutate([&](StoreTransaction& tx) {
        EpochSeconds now = clock_();
        settle_in(tx, now, report, settled);

        for (const auto& pair : config_.default_pairs) {
            tx.seed_for(pair);
        }

        UserAccount& user = tx.ensure_user(user_id, starting_balance_);
        view.balance = user.balance;

        for (const auto& trade : user.trades) {
            if (trade.settled) {
                continue;
            }
            ActiveTrade active;
            active.trade = trade;
            active.remaining_seconds = std::max<int64_t>(
                0, static_cast<int64_t>(std::floor(trade.expires_at - now)));
            active.entry_price = price_fn_(tx.seed_for(trade.pair), trade.placed_at);
            view.active_trades.push_back(std::move(active));
        }

        view.pair_seeds = tx.document().pair_seeds;
    });

    if (!status.ok) {
        UserView failed;
        failed.fail(ErrorCode::STORE_UNAVAILABLE, status.error);
        return failed;
    }

    publish_settlements(report, settled);
    return view;
}

TradeLookup TradeEngine::lookup_trade(const std::string& user_id, const std::string& trade_id) {
    TradeLookup lookup;
    if (user_id.empty() || trade_id.empty()) {
        lookup.fail(ErrorCode::INVALID_INPUT, "missing");
        return lookup;
    }

    SweepReport report;
    std::vector<SettledTrade> settled;

    auto status = store_->mutate([&](StoreTransaction& tx) {
        settle_in(tx, clock_(), report, settled);

        const UserAccount* user = tx.find_user(user_id);
        if (!user) {
            lookup.fail(ErrorCode::NOT_FOUND, "user not found");
            return;
        }

        const Trade* trade = user->find_trade(trade_id);
        if (!trade) {
            lookup.fail(ErrorCode::NOT_FOUND, "trade not found");
            return;
        }

        lookup.trade = *trade;
        lookup.balance = user->balance;
    });

    if (!status.ok) {
        TradeLookup failed;
        failed.fail(ErrorCode::STORE_UNAVAILABLE, status.error);
        return failed;
    }

    publish_settlements(report, settled);
    return lookup;
}

TradeHistory TradeEngine::trade_history(const std::string& user_id, size_t limit) {
    TradeHistory history;
    if (user_id.empty()) {
        history.fail(ErrorCode::INVALID_INPUT, "missing username");
        return history;
    }

    SweepReport report;
    std::vector<SettledTrade> settled;

    auto status = store_->mutate([&](StoreTransaction& tx) {
        settle_in(tx, clock_(), report, settled);

        const UserAccount* user = tx.find_user(user_id);
        if (!user) {
            history.fail(ErrorCode::NOT_FOUND, "user not found");
            return;
        }

        history.balance = user->balance;
        for (auto it = user->trades.rbegin(); it != user->trades.rend(); ++it) {
            if (!it->settled) {
                continue;
            }
            if (it->result == TradeResult::WIN) {
                history.wins++;
            } else {
                history.losses++;
            }
            if (limit == 0 || history.trades.size() < limit) {
                history.trades.push_back(*it);
            }
        }
    });

    if (!status.ok) {
        TradeHistory failed;
        failed.fail(ErrorCode::STORE_UNAVAILABLE, status.error);
        return failed;
    }

    publish_settlements(report, settled);
    return history;
}

PriceQuote TradeEngine::price_at(const std::string& pair, EpochSeconds ts) const {
    PriceQuote quote;
    auto seed = store_->find_seed(pair);
    quote.assigned = seed.has_value();
    quote.seed = seed ? *seed : oracle::hash_pair_seed(pair);
    quote.price = price_fn_(quote.seed, ts);
    return quote;
}

PriceSeries TradeEngine::price_series(const std::string& pair, EpochSeconds start,
                                      EpochSeconds end, EpochSeconds step) const {
    PriceSeries series;
    auto seed = store_->find_seed(pair);
    series.assigned = seed.has_value();
    series.seed = seed ? *seed : oracle::hash_pair_seed(pair);
    series.points = oracle::sample_series(series.seed, start, end, step, price_fn_);
    return series;
}

bool TradeEngine::register_pairs(const std::vector<std::string>& pairs) {
    auto status = store_->mutate([&](StoreTransaction& tx) {
        for (const auto& pair : pairs) {
            tx.seed_for(pair);
        }
    });
    return status.ok;
}

} // namespace desk
