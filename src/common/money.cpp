#include "common/money.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace desk {

namespace {

constexpr int MAX_FRACTION_DIGITS = 6;
constexpr int64_t MAX_WHOLE_UNITS = std::numeric_limits<int64_t>::max() / Money::SCALE;

} // namespace

bool Money::representable(double value) {
    return std::isfinite(value) && std::fabs(value) < static_cast<double>(MAX_WHOLE_UNITS);
}

Money Money::from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Money value must be finite");
    }
    if (!representable(value)) {
        throw std::invalid_argument(fmt::format("Money value out of range: {}", value));
    }
    return Money(static_cast<int64_t>(std::llround(value * SCALE)));
}

std::optional<Money> Money::parse(const std::string& text) {
    size_t i = 0;
    bool negative = false;

    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        ++i;
    }

    int64_t whole = 0;
    int whole_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        whole = whole * 10 + (text[i] - '0');
        if (whole > MAX_WHOLE_UNITS) return std::nullopt;
        ++whole_digits;
        ++i;
    }

    int64_t fraction = 0;
    int fraction_digits = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (fraction_digits == MAX_FRACTION_DIGITS) return std::nullopt;
            fraction = fraction * 10 + (text[i] - '0');
            ++fraction_digits;
            ++i;
        }
    }

    if (i != text.size() || (whole_digits == 0 && fraction_digits == 0)) {
        return std::nullopt;
    }

    for (int d = fraction_digits; d < MAX_FRACTION_DIGITS; ++d) {
        fraction *= 10;
    }

    int64_t micros = whole * SCALE + fraction;
    return Money(negative ? -micros : micros);
}

std::string Money::to_string() const {
    int64_t abs_micros = micros_ < 0 ? -micros_ : micros_;
    int64_t whole = abs_micros / SCALE;
    std::string frac = fmt::format("{:06d}", abs_micros % SCALE);

    // Keep at least cents
    while (frac.size() > 2 && frac.back() == '0') {
        frac.pop_back();
    }

    return fmt::format("{}{}.{}", micros_ < 0 ? "-" : "", whole, frac);
}

Money Money::scaled(int64_t num, int64_t den) const {
    if (den <= 0) {
        throw std::invalid_argument("Money::scaled requires a positive denominator");
    }

    // Split to keep the intermediate product in range
    int64_t q = micros_ / den;
    int64_t r = micros_ % den;

    int64_t rem = r * num;
    int64_t result = q * num + rem / den;
    int64_t leftover = rem % den;

    if (leftover != 0 && 2 * (leftover < 0 ? -leftover : leftover) >= den) {
        result += (leftover < 0) ? -1 : 1;
    }

    return Money(result);
}

void to_json(nlohmann::json& j, const Money& m) {
    j = m.to_string();
}

void from_json(const nlohmann::json& j, Money& m) {
    if (j.is_string()) {
        auto parsed = Money::parse(j.get<std::string>());
        if (!parsed) {
            throw std::invalid_argument("Invalid money string: " + j.get<std::string>());
        }
        m = *parsed;
    } else if (j.is_number()) {
        m = Money::from_double(j.get<double>());
    } else {
        throw std::invalid_argument("Money must be a string or number");
    }
}

} // namespace desk
