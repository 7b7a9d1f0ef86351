#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "persistence/document_store.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace desk {

// ============================================================================
// SQLITE DOCUMENT STORE
//
// Normalized layout of the document:
//   users(username, balance_micros)
//   trades(trade_id, username, seq, ...)   seq keeps per-user order
//   pair_seeds(pair, seed)
//
// save() replaces all rows inside one transaction, so a failed save leaves
// the previous document intact.
// ============================================================================

class SqliteDocumentStore : public DocumentStore {
public:
    explicit SqliteDocumentStore(const std::string& db_path);
    ~SqliteDocumentStore() override;

    // Non-copyable
    SqliteDocumentStore(const SqliteDocumentStore&) = delete;
    SqliteDocumentStore& operator=(const SqliteDocumentStore&) = delete;

    std::optional<StoreDocument> load() override;
    void save(const StoreDocument& document) override;
    std::unique_ptr<StoreLock> lock_exclusive() override;
    std::string describe() const override { return "sqlite:" + db_path_; }

    // Connection management
    bool is_open() const;
    void close();

    int get_schema_version();

private:
    static constexpr int BUSY_TIMEOUT_MS = 5000;

    sqlite3* db_{nullptr};
    std::string db_path_;

    void execute(const std::string& sql);
    void initialize_schema();

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_double(sqlite3_stmt* stmt, int index, double value);
    void bind_null(sqlite3_stmt* stmt, int index);
    void step_done(sqlite3_stmt* stmt, const char* what);
    void finalize(sqlite3_stmt* stmt);
    // Finalizes; throws StoreError unless the row loop ended with SQLITE_DONE
    void finish_rows(sqlite3_stmt* stmt, int rc, const char* what);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    double get_double(sqlite3_stmt* stmt, int col);
    bool is_null(sqlite3_stmt* stmt, int col);

    void insert_rows(const StoreDocument& document);
};

} // namespace desk
