#pragma once

#include <atomic>
#include <mutex>
#include <memory>
#include <thread>
#include <chrono>
#include <condition_variable>
#include "engine/trade_engine.hpp"

namespace desk {

/**
 * Background worker that settles expired trades on a fixed period, so that
 * settlement does not depend on the owner issuing a request.
 */
class SettlementSweeper {
public:
    SettlementSweeper(std::shared_ptr<TradeEngine> engine, std::chrono::milliseconds interval);
    ~SettlementSweeper();

    // Control
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Run one sweep on the calling thread
    SweepReport sweep_now();

    // Stats
    int64_t sweeps_run() const { return sweeps_run_.load(); }
    int64_t sweeps_failed() const { return sweeps_failed_.load(); }
    int64_t trades_settled() const { return trades_settled_.load(); }

private:
    std::shared_ptr<TradeEngine> engine_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::atomic<int64_t> sweeps_run_{0};
    std::atomic<int64_t> sweeps_failed_{0};
    std::atomic<int64_t> trades_settled_{0};

    void worker_loop();
};

} // namespace desk
