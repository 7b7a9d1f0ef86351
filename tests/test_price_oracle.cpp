#include <gtest/gtest.h>
#include "oracle/price_oracle.hpp"

using namespace desk;

// Reference values computed independently from the waveform formula
TEST(PriceOracleTest, MatchesReferenceValues) {
    EXPECT_NEAR(oracle::price_at(12345, 0.0), 1.17128670378233, 1e-12);
    EXPECT_NEAR(oracle::price_at(12345, 1700000000.0), 1.1734843512983595, 1e-12);
    EXPECT_NEAR(oracle::price_at(12345, 1700000001.0), 1.1734857565708092, 1e-12);
    EXPECT_NEAR(oracle::price_at(12345, 1700000060.0), 1.1735783348955253, 1e-12);
    EXPECT_NEAR(oracle::price_at(42, 1700000000.0), 1.0245067226117355, 1e-12);
    EXPECT_NEAR(oracle::price_at(99999, 1.5), 1.4963772827293826, 1e-12);
}

TEST(PriceOracleTest, IsDeterministic) {
    for (double ts : {0.0, 1.25, 1700000000.0, 1700000123.75}) {
        EXPECT_EQ(oracle::price_at(777, ts), oracle::price_at(777, ts));
    }
}

TEST(PriceOracleTest, StaysNearBaseline) {
    // baseline in [1.0, 1.5) plus at most 0.0025 + 0.0015 + 0.0004
    for (int64_t seed : {1, 500, 999, 12345, 99999}) {
        for (double ts = 1700000000.0; ts < 1700003600.0; ts += 97.0) {
            double p = oracle::price_at(seed, ts);
            EXPECT_GT(p, 0.99);
            EXPECT_LT(p, 1.51);
        }
    }
}

TEST(PriceOracleTest, NegativeInputsUseFloorModulo) {
    double p = oracle::price_at(-7, -3.0);
    EXPECT_GT(p, 0.99);
    EXPECT_LT(p, 1.51);
}

TEST(PriceOracleTest, HashSeedIsStableAndInRange) {
    int64_t eur = oracle::hash_pair_seed("EUR/USD");
    EXPECT_EQ(eur, oracle::hash_pair_seed("EUR/USD"));
    EXPECT_NE(eur, oracle::hash_pair_seed("GBP/USD"));

    for (const char* pair : {"", "EUR/USD", "BTC/USD", "XYZ/ABC", "a"}) {
        int64_t seed = oracle::hash_pair_seed(pair);
        EXPECT_GE(seed, 1);
        EXPECT_LE(seed, oracle::MAX_HASH_SEED);
    }
}

TEST(PriceOracleTest, SampleSeriesIncludesBothEnds) {
    auto points = oracle::sample_series(12345, 1700000000.0, 1700000060.0, 30.0);
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].ts, 1700000000.0);
    EXPECT_DOUBLE_EQ(points[2].ts, 1700000060.0);
    EXPECT_DOUBLE_EQ(points[1].price, oracle::price_at(12345, 1700000030.0));
}

TEST(PriceOracleTest, SampleSeriesEdgeCases) {
    EXPECT_TRUE(oracle::sample_series(1, 10.0, 20.0, 0.0).empty());
    EXPECT_TRUE(oracle::sample_series(1, 10.0, 20.0, -1.0).empty());
    EXPECT_TRUE(oracle::sample_series(1, 20.0, 10.0, 1.0).empty());
    EXPECT_EQ(oracle::sample_series(1, 10.0, 10.0, 1.0).size(), 1u);
    EXPECT_EQ(oracle::sample_series(1, 0.0, 1e9, 1.0).size(), oracle::MAX_SERIES_POINTS);
}

TEST(PriceOracleTest, SampleSeriesUsesGivenPriceFunction) {
    auto points = oracle::sample_series(7, 0.0, 2.0, 1.0,
                                        [](int64_t seed, EpochSeconds ts) { return seed + ts; });
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].price, 7.0);
    EXPECT_DOUBLE_EQ(points[2].price, 9.0);
}

TEST(PriceOracleTest, ValidTimestampBounds) {
    EXPECT_TRUE(oracle::valid_timestamp(0.0));
    EXPECT_TRUE(oracle::valid_timestamp(-1700000000.0));
    EXPECT_TRUE(oracle::valid_timestamp(8.9e18));
    EXPECT_FALSE(oracle::valid_timestamp(1e300));
    EXPECT_FALSE(oracle::valid_timestamp(-9.3e18));
}
