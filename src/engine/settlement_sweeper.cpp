#include "engine/settlement_sweeper.hpp"
#include <spdlog/spdlog.h>

namespace desk {

SettlementSweeper::SettlementSweeper(std::shared_ptr<TradeEngine> engine,
                                     std::chrono::milliseconds interval)
    : engine_(std::move(engine))
    , interval_(interval)
{
}

SettlementSweeper::~SettlementSweeper() {
    stop();
}

void SettlementSweeper::start() {
    if (running_.load()) return;

    running_.store(true);
    worker_thread_ = std::thread(&SettlementSweeper::worker_loop, this);
    spdlog::info("SettlementSweeper started: every {}ms", interval_.count());
}

void SettlementSweeper::stop() {
    if (!running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(false);
    }
    wait_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    spdlog::info("SettlementSweeper stopped: sweeps={}, failed={}, settled={}",
                 sweeps_run_.load(), sweeps_failed_.load(), trades_settled_.load());
}

SweepReport SettlementSweeper::sweep_now() {
    auto report = engine_->settle_expired();
    sweeps_run_++;

    if (!report.ok) {
        sweeps_failed_++;
        spdlog::error("Settlement sweep failed: {}", report.message);
        return report;
    }

    trades_settled_ += report.settled;
    if (report.settled > 0) {
        spdlog::info("Sweep settled {} trades ({} won, {} lost), credited {}",
                     report.settled, report.wins, report.losses, report.credited.to_string());
    }
    return report;
}

void SettlementSweeper::worker_loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
            if (!running_.load()) break;
        }

        sweep_now();
    }
}

} // namespace desk
