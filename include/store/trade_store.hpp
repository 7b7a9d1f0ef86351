#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include "common/types.hpp"
#include "store/document.hpp"
#include "persistence/document_store.hpp"

namespace desk {

/**
 * Assigns a seed the first time a pair is referenced.
 */
using SeedSource = std::function<int64_t(const std::string& pair)>;

// Deterministic: oracle::hash_pair_seed
SeedSource make_hash_seed_source();

// Uniform random in [min_seed, max_seed]
SeedSource make_random_seed_source(int64_t min_seed, int64_t max_seed);

/**
 * Outcome of a store critical section.
 */
struct StoreStatus {
    bool ok{true};
    std::string error;
};

/**
 * Working view handed to a mutation. Changes land on a private copy of the
 * document and become visible only if the mutation completes, is not rolled
 * back, and the backend accepts the save.
 */
class StoreTransaction {
public:
    StoreTransaction(StoreDocument& document, const SeedSource& seed_source);

    StoreDocument& document() { return document_; }

    // Seed for pair, assigning and recording one on first reference
    int64_t seed_for(const std::string& pair);
    std::optional<int64_t> find_seed(const std::string& pair) const;

    UserAccount* find_user(const std::string& username);
    UserAccount& ensure_user(const std::string& username, const Money& starting_balance);

    void mark_dirty() { dirty_ = true; }
    bool dirty() const { return dirty_; }

    // Discard every change made in this transaction
    void rollback() { rolled_back_ = true; }
    bool rolled_back() const { return rolled_back_; }

private:
    StoreDocument& document_;
    const SeedSource& seed_source_;
    bool dirty_{false};
    bool rolled_back_{false};
};

/**
 * Single source of truth for users, trades and pair seeds.
 *
 * One mutex serializes every critical section. The document is loaded from
 * the backend at construction and saved after each mutation that changed
 * something. Backends shared between processes also hand out a lock; each
 * mutation then holds it and reloads the document before running. Reads
 * outside mutate() see the state as of the last mutation.
 */
class TradeStore {
public:
    using MutateFn = std::function<void(StoreTransaction&)>;

    // Throws StoreError if the backend holds data that cannot be read
    TradeStore(std::shared_ptr<DocumentStore> backend, SeedSource seed_source);

    // Exclusive read-modify-write; never throws StoreError
    StoreStatus mutate(const MutateFn& fn);

    std::optional<int64_t> find_seed(const std::string& pair) const;
    StoreDocument snapshot() const;

    const DocumentStore& backend() const { return *backend_; }

private:
    std::shared_ptr<DocumentStore> backend_;
    SeedSource seed_source_;

    mutable std::mutex mutex_;
    StoreDocument document_;
};

} // namespace desk
