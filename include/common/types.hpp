#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>

namespace desk {

// Time types
using WallClock = std::chrono::time_point<std::chrono::system_clock>;

// Epoch seconds with sub-second precision, as stored on trades
using EpochSeconds = double;

// Source of "now" for the engine (injectable for tests)
using Clock = std::function<EpochSeconds()>;

inline EpochSeconds epoch_now() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Prices are plain doubles; only their relative order decides an outcome
using Price = double;

// Side enum
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

std::optional<Side> side_from_string(const std::string& s);

// Settlement outcome
enum class TradeResult {
    WIN,
    LOSS
};

inline std::string result_to_string(TradeResult r) {
    return r == TradeResult::WIN ? "win" : "loss";
}

std::optional<TradeResult> result_from_string(const std::string& s);

// Error kinds surfaced by the engine
enum class ErrorCode {
    NONE,
    INVALID_INPUT,
    INSUFFICIENT_BALANCE,
    NOT_FOUND,
    STORE_UNAVAILABLE
};

inline std::string error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorCode::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

} // namespace desk
