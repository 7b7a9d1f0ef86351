#include "common/types.hpp"
#include <algorithm>
#include <cctype>

namespace desk {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::optional<Side> side_from_string(const std::string& s) {
    std::string v = lowercase(s);
    if (v == "buy") return Side::BUY;
    if (v == "sell") return Side::SELL;
    return std::nullopt;
}

std::optional<TradeResult> result_from_string(const std::string& s) {
    std::string v = lowercase(s);
    if (v == "win") return TradeResult::WIN;
    if (v == "loss") return TradeResult::LOSS;
    return std::nullopt;
}

} // namespace desk
