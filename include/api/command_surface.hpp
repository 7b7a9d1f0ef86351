#pragma once

#include <string>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "engine/trade_engine.hpp"

namespace desk {

/**
 * JSON request/response binding over the engine.
 *
 * Every handler takes the request object and returns the response object.
 * Failures come back as {"ok": false, "error": <message>}; nothing throws.
 * Money leaves this layer as JSON numbers.
 */
class CommandSurface {
public:
    explicit CommandSurface(std::shared_ptr<TradeEngine> engine);

    // {username}
    nlohmann::json get_user_state(const nlohmann::json& request);

    // {username, pair, side, amount, duration?}
    nlohmann::json open_trade(const nlohmann::json& request);

    // {username, trade_id}
    nlohmann::json settle_trade(const nlohmann::json& request);

    // {pair?, ts?}
    nlohmann::json price_at(const nlohmann::json& request);

    // {username, limit?}
    nlohmann::json trade_history(const nlohmann::json& request);

    // {pair, start, end, step?}
    nlohmann::json price_series(const nlohmann::json& request);

    // Dispatch on request["op"]
    nlohmann::json handle(const nlohmann::json& request);

    // One JSON-lines exchange: parse, dispatch, serialize
    std::string handle_line(const std::string& line);

    static nlohmann::json error_response(const std::string& message);
    static nlohmann::json trade_to_json(const Trade& trade);

private:
    std::shared_ptr<TradeEngine> engine_;

    static std::string error_message(const EngineStatus& status);
};

// Numeric request fields may arrive as JSON numbers or numeric strings
std::optional<double> json_number(const nlohmann::json& value);
std::optional<Money> json_money(const nlohmann::json& value);

} // namespace desk
