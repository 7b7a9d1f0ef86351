#include "api/command_surface.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace desk {

namespace {

constexpr const char* DEFAULT_PAIR = "EUR/USD";
constexpr double DEFAULT_SERIES_STEP = 1.0;
constexpr int64_t MAX_HISTORY_LIMIT = std::numeric_limits<int32_t>::max();

bool valid_utf8(const std::string& text) {
    try {
        nlohmann::json(text).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

// Empty when absent, not a string or not valid UTF-8
std::string string_field(const nlohmann::json& request, const char* key) {
    if (!request.contains(key) || !request[key].is_string()) {
        return "";
    }
    auto value = request[key].get<std::string>();
    if (!valid_utf8(value)) {
        spdlog::debug("Rejected non-UTF-8 '{}' field", key);
        return "";
    }
    return value;
}

std::optional<EpochSeconds> json_timestamp(const nlohmann::json& value) {
    auto ts = json_number(value);
    if (!ts || !oracle::valid_timestamp(*ts)) return std::nullopt;
    return ts;
}

} // namespace

std::optional<double> json_number(const nlohmann::json& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        if (!std::isfinite(d)) return std::nullopt;
        return d;
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || !std::isfinite(d)) {
            return std::nullopt;
        }
        return d;
    }
    return std::nullopt;
}

std::optional<Money> json_money(const nlohmann::json& value) {
    if (value.is_string()) {
        return Money::parse(value.get<std::string>());
    }
    auto d = json_number(value);
    if (!d || !Money::representable(*d)) return std::nullopt;
    return Money::from_double(*d);
}

CommandSurface::CommandSurface(std::shared_ptr<TradeEngine> engine)
    : engine_(std::move(engine))
{
}

nlohmann::json CommandSurface::error_response(const std::string& message) {
    return nlohmann::json{{"ok", false}, {"error", message}};
}

std::string CommandSurface::error_message(const EngineStatus& status) {
    if (status.error == ErrorCode::STORE_UNAVAILABLE) {
        return "store unavailable";
    }
    return status.message;
}

nlohmann::json CommandSurface::trade_to_json(const Trade& trade) {
    nlohmann::json j{
        {"trade_id", trade.trade_id},
        {"pair", trade.pair},
        {"side", side_to_string(trade.side)},
        {"amount", trade.amount.to_double()},
        {"placed_at", trade.placed_at},
        {"expires_at", trade.expires_at},
        {"settled", trade.settled}
    };
    if (trade.exit_price) j["exit_price"] = *trade.exit_price;
    if (trade.result) j["result"] = result_to_string(*trade.result);
    if (trade.settled_at) j["settled_at"] = *trade.settled_at;
    if (trade.settled) j["payout"] = trade.payout.to_double();
    return j;
}

nlohmann::json CommandSurface::get_user_state(const nlohmann::json& request) {
    auto username = string_field(request, "username");
    if (username.empty()) {
        return error_response("missing username");
    }

    auto view = engine_->get_user_view(username);
    if (!view.ok) {
        return error_response(error_message(view));
    }

    nlohmann::json active = nlohmann::json::array();
    for (const auto& a : view.active_trades) {
        active.push_back({
            {"trade_id", a.trade.trade_id},
            {"pair", a.trade.pair},
            {"side", side_to_string(a.trade.side)},
            {"amount", a.trade.amount.to_double()},
            {"placed_at", a.trade.placed_at},
            {"expires_at", a.trade.expires_at},
            {"remaining", a.remaining_seconds},
            {"entry_price", a.entry_price}
        });
    }

    return {
        {"ok", true},
        {"balance", view.balance.to_double()},
        {"active_trades", active},
        {"pair_seeds", view.pair_seeds}
    };
}

nlohmann::json CommandSurface::open_trade(const nlohmann::json& request) {
    OpenTradeRequest req;
    req.user_id = string_field(request, "username");
    req.pair = string_field(request, "pair");

    auto side = side_from_string(string_field(request, "side"));
    if (req.user_id.empty() || req.pair.empty() || !side) {
        return error_response("invalid payload");
    }
    req.side = *side;

    if (!request.contains("amount")) {
        return error_response("invalid payload");
    }
    auto amount = json_money(request["amount"]);
    if (!amount || !amount->is_positive()) {
        return error_response("invalid payload");
    }
    req.amount = *amount;

    req.duration_seconds = engine_->config().default_duration_seconds;
    if (request.contains("duration") && !request["duration"].is_null()) {
        auto duration = json_number(request["duration"]);
        if (!duration || *duration < 1.0 ||
            *duration > static_cast<double>(std::numeric_limits<int32_t>::max())) {
            return error_response("invalid payload");
        }
        req.duration_seconds = static_cast<int64_t>(*duration);
    }

    auto result = engine_->open_trade(req);
    if (!result.ok) {
        return error_response(error_message(result));
    }

    return {
        {"ok", true},
        {"trade_id", result.trade_id},
        {"new_balance", result.new_balance.to_double()}
    };
}

nlohmann::json CommandSurface::settle_trade(const nlohmann::json& request) {
    auto username = string_field(request, "username");
    auto trade_id = string_field(request, "trade_id");
    if (username.empty() || trade_id.empty()) {
        return error_response("missing");
    }

    auto lookup = engine_->lookup_trade(username, trade_id);
    if (!lookup.ok) {
        return error_response(error_message(lookup));
    }

    return {
        {"ok", true},
        {"trade", trade_to_json(lookup.trade)},
        {"balance", lookup.balance.to_double()}
    };
}

nlohmann::json CommandSurface::price_at(const nlohmann::json& request) {
    std::string pair = string_field(request, "pair");
    if (pair.empty()) {
        pair = DEFAULT_PAIR;
    }

    EpochSeconds ts = engine_->now();
    if (request.contains("ts") && !request["ts"].is_null()) {
        auto parsed = json_timestamp(request["ts"]);
        if (!parsed) {
            return error_response("invalid payload");
        }
        ts = *parsed;
    }

    auto quote = engine_->price_at(pair, ts);
    return {
        {"ok", true},
        {"pair", pair},
        {"ts", ts},
        {"price", quote.price},
        {"seed", quote.seed},
        {"assigned", quote.assigned}
    };
}

nlohmann::json CommandSurface::trade_history(const nlohmann::json& request) {
    auto username = string_field(request, "username");
    if (username.empty()) {
        return error_response("missing username");
    }

    size_t limit = 0;
    if (request.contains("limit") && !request["limit"].is_null()) {
        auto parsed = json_number(request["limit"]);
        if (!parsed) {
            return error_response("invalid payload");
        }
        // Non-positive or beyond any real history: list everything
        if (*parsed > 0 && *parsed < static_cast<double>(MAX_HISTORY_LIMIT)) {
            limit = static_cast<size_t>(*parsed);
        }
    }

    auto history = engine_->trade_history(username, limit);
    if (!history.ok) {
        return error_response(error_message(history));
    }

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : history.trades) {
        trades.push_back(trade_to_json(t));
    }

    return {
        {"ok", true},
        {"balance", history.balance.to_double()},
        {"wins", history.wins},
        {"losses", history.losses},
        {"trades", trades}
    };
}

nlohmann::json CommandSurface::price_series(const nlohmann::json& request) {
    std::string pair = string_field(request, "pair");
    if (pair.empty()) {
        pair = DEFAULT_PAIR;
    }

    if (!request.contains("start") || !request.contains("end")) {
        return error_response("invalid payload");
    }
    auto start = json_timestamp(request["start"]);
    auto end = json_timestamp(request["end"]);
    if (!start || !end) {
        return error_response("invalid payload");
    }

    double step = DEFAULT_SERIES_STEP;
    if (request.contains("step") && !request["step"].is_null()) {
        auto parsed = json_number(request["step"]);
        if (!parsed) {
            return error_response("invalid payload");
        }
        step = *parsed;
    }

    auto series = engine_->price_series(pair, *start, *end, step);

    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : series.points) {
        points.push_back({p.ts, p.price});
    }

    return {
        {"ok", true},
        {"pair", pair},
        {"seed", series.seed},
        {"assigned", series.assigned},
        {"points", points}
    };
}

nlohmann::json CommandSurface::handle(const nlohmann::json& request) {
    if (!request.is_object()) {
        return error_response("invalid payload");
    }

    auto op = string_field(request, "op");
    if (op == "user_data") return get_user_state(request);
    if (op == "start_trade") return open_trade(request);
    if (op == "settle_trade") return settle_trade(request);
    if (op == "price_at") return price_at(request);
    if (op == "history") return trade_history(request);
    if (op == "price_series") return price_series(request);

    spdlog::debug("Unknown op: '{}'", op);
    return error_response("unknown op");
}

std::string CommandSurface::handle_line(const std::string& line) {
    auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        spdlog::warn("Rejected malformed request line ({} bytes)", line.size());
        return error_response("invalid payload").dump();
    }
    // Stored names predating UTF-8 checks are replaced rather than thrown
    return handle(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace desk
