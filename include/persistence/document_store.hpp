#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include "store/document.hpp"

namespace desk {

/**
 * Raised by a backend when it cannot read or write the document.
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Held while a caller reads, changes and writes back the document.
 */
class StoreLock {
public:
    virtual ~StoreLock() = default;
};

/**
 * Persistence collaborator: get/set of the whole document.
 *
 * load() returns nullopt when nothing has been stored yet and throws
 * StoreError when stored data exists but cannot be read. save() either
 * persists the full document or throws StoreError.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<StoreDocument> load() = 0;
    virtual void save(const StoreDocument& document) = 0;

    // Exclusion against other processes sharing the same data. Null when the
    // document is private to this process. Throws StoreError on failure.
    virtual std::unique_ptr<StoreLock> lock_exclusive() { return nullptr; }

    // Short backend label for logs
    virtual std::string describe() const = 0;
};

/**
 * Keeps the last saved document in memory. Used by tests and --backend memory.
 */
class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore() = default;
    explicit MemoryDocumentStore(StoreDocument initial) : document_(std::move(initial)) {}

    std::optional<StoreDocument> load() override;
    void save(const StoreDocument& document) override;
    std::string describe() const override { return "memory"; }

    int save_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<StoreDocument> document_;
    int save_count_{0};
};

} // namespace desk
