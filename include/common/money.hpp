#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace desk {

/**
 * Fixed-point money amount stored as signed micro-units (1e-6).
 * Balances, stakes and payouts all use this type so that debits and
 * credits add up exactly.
 */
class Money {
public:
    static constexpr int64_t SCALE = 1000000;

    Money() = default;

    static Money from_micros(int64_t micros) { return Money(micros); }
    static Money from_whole(int64_t units) { return Money(units * SCALE); }

    // Rounds to the nearest micro-unit; throws std::invalid_argument unless representable()
    static Money from_double(double value);

    // Finite and small enough to hold in micro-units
    static bool representable(double value);

    // Exact decimal parse: "100", "-3.5", "0.000001". Rejects more than 6 decimals.
    static std::optional<Money> parse(const std::string& text);

    int64_t micros() const { return micros_; }
    double to_double() const { return static_cast<double>(micros_) / SCALE; }

    // Decimal string with at least two fractional digits ("1095.00", "0.125")
    std::string to_string() const;

    // this * num / den, rounded half away from zero
    Money scaled(int64_t num, int64_t den) const;

    bool is_positive() const { return micros_ > 0; }
    bool is_negative() const { return micros_ < 0; }
    bool is_zero() const { return micros_ == 0; }

    Money operator+(const Money& o) const { return Money(micros_ + o.micros_); }
    Money operator-(const Money& o) const { return Money(micros_ - o.micros_); }
    Money& operator+=(const Money& o) { micros_ += o.micros_; return *this; }
    Money& operator-=(const Money& o) { micros_ -= o.micros_; return *this; }

    bool operator==(const Money& o) const { return micros_ == o.micros_; }
    bool operator!=(const Money& o) const { return micros_ != o.micros_; }
    bool operator<(const Money& o) const { return micros_ < o.micros_; }
    bool operator<=(const Money& o) const { return micros_ <= o.micros_; }
    bool operator>(const Money& o) const { return micros_ > o.micros_; }
    bool operator>=(const Money& o) const { return micros_ >= o.micros_; }

private:
    explicit Money(int64_t micros) : micros_(micros) {}

    int64_t micros_{0};
};

// Written as a decimal string; read from either a string or a JSON number
void to_json(nlohmann::json& j, const Money& m);
void from_json(const nlohmann::json& j, Money& m);

} // namespace desk
