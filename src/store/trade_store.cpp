#include "store/trade_store.hpp"
#include "oracle/price_oracle.hpp"
#include <spdlog/spdlog.h>
#include <random>
#include <stdexcept>

namespace desk {

SeedSource make_hash_seed_source() {
    return [](const std::string& pair) { return oracle::hash_pair_seed(pair); };
}

SeedSource make_random_seed_source(int64_t min_seed, int64_t max_seed) {
    if (min_seed > max_seed) {
        throw std::invalid_argument("min_seed must not exceed max_seed");
    }

    auto gen = std::make_shared<std::mt19937_64>(std::random_device{}());
    // Only called inside a store critical section, so gen needs no lock of its own
    return [gen, min_seed, max_seed](const std::string&) {
        std::uniform_int_distribution<int64_t> dis(min_seed, max_seed);
        return dis(*gen);
    };
}

// StoreTransaction

StoreTransaction::StoreTransaction(StoreDocument& document, const SeedSource& seed_source)
    : document_(document)
    , seed_source_(seed_source)
{
}

int64_t StoreTransaction::seed_for(const std::string& pair) {
    auto it = document_.pair_seeds.find(pair);
    if (it != document_.pair_seeds.end()) {
        return it->second;
    }

    int64_t seed = seed_source_(pair);
    document_.pair_seeds.emplace(pair, seed);
    dirty_ = true;

    spdlog::info("Assigned seed {} to pair {}", seed, pair);
    return seed;
}

std::optional<int64_t> StoreTransaction::find_seed(const std::string& pair) const {
    auto it = document_.pair_seeds.find(pair);
    if (it == document_.pair_seeds.end()) {
        return std::nullopt;
    }
    return it->second;
}

UserAccount* StoreTransaction::find_user(const std::string& username) {
    auto it = document_.users.find(username);
    return it != document_.users.end() ? &it->second : nullptr;
}

UserAccount& StoreTransaction::ensure_user(const std::string& username,
                                           const Money& starting_balance) {
    auto it = document_.users.find(username);
    if (it != document_.users.end()) {
        return it->second;
    }

    UserAccount account;
    account.balance = starting_balance;
    dirty_ = true;

    spdlog::debug("Created user {} with balance {}", username, starting_balance.to_string());
    return document_.users.emplace(username, std::move(account)).first->second;
}

// TradeStore

TradeStore::TradeStore(std::shared_ptr<DocumentStore> backend, SeedSource seed_source)
    : backend_(std::move(backend))
    , seed_source_(std::move(seed_source))
{
    auto loaded = backend_->load();
    if (loaded) {
        document_ = std::move(*loaded);
        spdlog::info("TradeStore loaded from {}: {} users, {} pairs",
                     backend_->describe(), document_.users.size(), document_.pair_seeds.size());
    } else {
        spdlog::info("TradeStore starting empty ({})", backend_->describe());
    }
}

StoreStatus TradeStore::mutate(const MutateFn& fn) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Another process may have saved since our last load
    std::unique_ptr<StoreLock> process_lock;
    try {
        process_lock = backend_->lock_exclusive();
        if (process_lock) {
            auto loaded = backend_->load();
            document_ = loaded ? std::move(*loaded) : StoreDocument{};
        }
    } catch (const StoreError& e) {
        spdlog::error("Store reload failed ({}): {}", backend_->describe(), e.what());
        return {false, e.what()};
    }

    StoreDocument working = document_;
    StoreTransaction tx(working, seed_source_);

    fn(tx);

    if (tx.rolled_back() || !tx.dirty()) {
        return {};
    }

    try {
        backend_->save(working);
    } catch (const StoreError& e) {
        spdlog::error("Store save failed ({}): {}", backend_->describe(), e.what());
        return {false, e.what()};
    }

    document_ = std::move(working);
    return {};
}

std::optional<int64_t> TradeStore::find_seed(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = document_.pair_seeds.find(pair);
    if (it == document_.pair_seeds.end()) {
        return std::nullopt;
    }
    return it->second;
}

StoreDocument TradeStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_;
}

} // namespace desk
