#include <gtest/gtest.h>
#include "common/money.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace desk;

// ============================================================================
// Parsing
// ============================================================================

TEST(MoneyTest, ParsesWholeAndFractionalAmounts) {
    EXPECT_EQ(Money::parse("100")->micros(), 100000000);
    EXPECT_EQ(Money::parse("0.000001")->micros(), 1);
    EXPECT_EQ(Money::parse("-3.5")->micros(), -3500000);
    EXPECT_EQ(Money::parse(".25")->micros(), 250000);
    EXPECT_EQ(Money::parse("+7")->micros(), 7000000);
}

TEST(MoneyTest, RejectsMalformedText) {
    EXPECT_FALSE(Money::parse("").has_value());
    EXPECT_FALSE(Money::parse("-").has_value());
    EXPECT_FALSE(Money::parse("abc").has_value());
    EXPECT_FALSE(Money::parse("1.2.3").has_value());
    EXPECT_FALSE(Money::parse("10 ").has_value());
    EXPECT_FALSE(Money::parse("1e3").has_value());
}

TEST(MoneyTest, RejectsMoreThanSixDecimals) {
    EXPECT_TRUE(Money::parse("1.123456").has_value());
    EXPECT_FALSE(Money::parse("1.1234567").has_value());
}

TEST(MoneyTest, FromDoubleRoundsToNearestMicro) {
    EXPECT_EQ(Money::from_double(0.1).micros(), 100000);
    EXPECT_EQ(Money::from_double(1000.0).micros(), 1000000000);
    EXPECT_EQ(Money::from_double(0.0000004).micros(), 0);
    EXPECT_EQ(Money::from_double(0.0000006).micros(), 1);
}

TEST(MoneyTest, FromDoubleRejectsNonFinite) {
    EXPECT_THROW(Money::from_double(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(Money::from_double(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(MoneyTest, RepresentableBoundsFromDouble) {
    EXPECT_TRUE(Money::representable(1000.0));
    EXPECT_TRUE(Money::representable(-9.0e12));
    EXPECT_FALSE(Money::representable(1e20));
    EXPECT_FALSE(Money::representable(-1e13));
    EXPECT_FALSE(Money::representable(std::numeric_limits<double>::infinity()));

    EXPECT_THROW(Money::from_double(1e20), std::invalid_argument);
}

// ============================================================================
// Formatting and arithmetic
// ============================================================================

TEST(MoneyTest, ToStringKeepsAtLeastCents) {
    EXPECT_EQ(Money::from_whole(1095).to_string(), "1095.00");
    EXPECT_EQ(Money::parse("0.125")->to_string(), "0.125");
    EXPECT_EQ(Money::parse("-2.5")->to_string(), "-2.50");
    EXPECT_EQ(Money().to_string(), "0.00");
}

TEST(MoneyTest, WinCreditIsExact) {
    // 100 staked at a 95% payout credits 195
    EXPECT_EQ(Money::from_whole(100).scaled(195, 100), Money::from_whole(195));
    EXPECT_EQ(Money::parse("0.01")->scaled(195, 100), *Money::parse("0.0195"));
    EXPECT_EQ(Money::parse("33.33")->scaled(195, 100), *Money::parse("64.9935"));
}

TEST(MoneyTest, ScaledRoundsHalfAwayFromZero) {
    EXPECT_EQ(Money::from_micros(1).scaled(1, 2).micros(), 1);
    EXPECT_EQ(Money::from_micros(-1).scaled(1, 2).micros(), -1);
    EXPECT_EQ(Money::from_micros(1).scaled(1, 3).micros(), 0);
    EXPECT_THROW(Money::from_micros(1).scaled(1, 0), std::invalid_argument);
}

TEST(MoneyTest, DebitAndCreditAddUp) {
    Money balance = Money::from_whole(1000);
    balance -= Money::from_whole(100);
    EXPECT_EQ(balance.to_string(), "900.00");
    balance += Money::from_whole(100).scaled(195, 100);
    EXPECT_EQ(balance.to_string(), "1095.00");
    EXPECT_TRUE(balance > Money::from_whole(1094));
    EXPECT_FALSE(balance.is_negative());
}

// ============================================================================
// JSON
// ============================================================================

TEST(MoneyTest, JsonWritesStringReadsStringOrNumber) {
    nlohmann::json j = Money::parse("12.5").value();
    EXPECT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), "12.50");

    EXPECT_EQ(nlohmann::json("12.5").get<Money>(), *Money::parse("12.5"));
    EXPECT_EQ(nlohmann::json(1095.0).get<Money>(), Money::from_whole(1095));
    EXPECT_THROW(nlohmann::json("twelve").get<Money>(), std::invalid_argument);
    EXPECT_THROW(nlohmann::json(true).get<Money>(), std::invalid_argument);
}
