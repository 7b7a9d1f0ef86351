#include <gtest/gtest.h>
#include "engine/settlement_sweeper.hpp"
#include <thread>

using namespace desk;

class SettlementSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<std::atomic<double>>(1700000000.0);
        auto now = now_;
        store_ = std::make_shared<TradeStore>(
            std::make_shared<MemoryDocumentStore>(),
            [](const std::string&) { return int64_t{12345}; });
        engine_ = std::make_shared<TradeEngine>(
            store_, EngineConfig{}, [now] { return now->load(); });
    }

    void open_buy(const std::string& user) {
        OpenTradeRequest req;
        req.user_id = user;
        req.pair = "EUR/USD";
        req.side = Side::BUY;
        req.amount = Money::from_whole(100);
        req.duration_seconds = 1;
        ASSERT_TRUE(engine_->open_trade(req).ok);
    }

    std::shared_ptr<std::atomic<double>> now_;
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<TradeEngine> engine_;
};

TEST_F(SettlementSweeperTest, SweepNowSettlesExpiredTrades) {
    SettlementSweeper sweeper(engine_, std::chrono::milliseconds(1000));
    open_buy("alice");

    auto early = sweeper.sweep_now();
    EXPECT_EQ(early.settled, 0);

    now_->store(1700000001.0);
    auto report = sweeper.sweep_now();
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.settled, 1);
    EXPECT_EQ(report.wins, 1);

    EXPECT_EQ(sweeper.sweeps_run(), 2);
    EXPECT_EQ(sweeper.trades_settled(), 1);
    EXPECT_EQ(store_->snapshot().users.at("alice").balance, Money::from_whole(1095));
}

TEST_F(SettlementSweeperTest, BackgroundThreadSettlesWithoutRequests) {
    SettlementSweeper sweeper(engine_, std::chrono::milliseconds(10));
    open_buy("alice");
    open_buy("bob");

    sweeper.start();
    EXPECT_TRUE(sweeper.is_running());
    now_->store(1700000001.0);

    for (int i = 0; i < 300 && sweeper.trades_settled() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sweeper.stop();

    EXPECT_FALSE(sweeper.is_running());
    EXPECT_EQ(sweeper.trades_settled(), 2);
    EXPECT_EQ(engine_->trades_settled(), 2);
}

TEST_F(SettlementSweeperTest, StopIsIdempotent) {
    SettlementSweeper sweeper(engine_, std::chrono::milliseconds(5));
    sweeper.stop();
    sweeper.start();
    sweeper.start();
    sweeper.stop();
    sweeper.stop();
    EXPECT_FALSE(sweeper.is_running());
}
