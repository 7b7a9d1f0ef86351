#include "persistence/sqlite_store.hpp"
#include "persistence/file_lock.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace desk {

// ============================================================================
// DATABASE IMPLEMENTATION
// ============================================================================

SqliteDocumentStore::SqliteDocumentStore(const std::string& db_path)
    : db_path_(db_path)
{
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open database: " + error);
    }

    // Wait for another process's write lock instead of failing with SQLITE_BUSY
    sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);

    try {
        // Enable foreign keys
        execute("PRAGMA foreign_keys = ON;");

        // WAL mode for better concurrent access
        execute("PRAGMA journal_mode = WAL;");

        initialize_schema();
    } catch (const StoreError&) {
        close();
        throw;
    }

    spdlog::info("SqliteDocumentStore opened: {}", db_path);
}

SqliteDocumentStore::~SqliteDocumentStore() {
    close();
}

bool SqliteDocumentStore::is_open() const {
    return db_ != nullptr;
}

void SqliteDocumentStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("SqliteDocumentStore closed");
    }
}

void SqliteDocumentStore::execute(const std::string& sql) {
    if (!db_) {
        throw StoreError("Database is closed");
    }

    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw StoreError("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* SqliteDocumentStore::prepare(const std::string& sql) {
    if (!db_) {
        throw StoreError("Database is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError("Failed to prepare statement: " +
                         std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteDocumentStore::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteDocumentStore::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void SqliteDocumentStore::bind_double(sqlite3_stmt* stmt, int index, double value) {
    sqlite3_bind_double(stmt, index, value);
}

void SqliteDocumentStore::bind_null(sqlite3_stmt* stmt, int index) {
    sqlite3_bind_null(stmt, index);
}

void SqliteDocumentStore::step_done(sqlite3_stmt* stmt, const char* what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw StoreError(std::string("Failed to ") + what + ": " + error);
    }
}

void SqliteDocumentStore::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

void SqliteDocumentStore::finish_rows(sqlite3_stmt* stmt, int rc, const char* what) {
    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        finalize(stmt);
        throw StoreError(std::string("Failed to ") + what + ": " + error);
    }
    finalize(stmt);
}

std::string SqliteDocumentStore::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t SqliteDocumentStore::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double SqliteDocumentStore::get_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

bool SqliteDocumentStore::is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// ============================================================================
// SCHEMA
// ============================================================================

void SqliteDocumentStore::initialize_schema() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS users (
            username TEXT PRIMARY KEY,
            balance_micros INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS trades (
            trade_id TEXT PRIMARY KEY,
            username TEXT NOT NULL,
            seq INTEGER NOT NULL,
            pair TEXT NOT NULL,
            side TEXT NOT NULL,
            amount_micros INTEGER NOT NULL,
            placed_at REAL NOT NULL,
            expires_at REAL NOT NULL,
            settled INTEGER NOT NULL,
            exit_price REAL,
            result TEXT,
            settled_at REAL,
            payout_micros INTEGER NOT NULL,
            FOREIGN KEY (username) REFERENCES users(username)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS pair_seeds (
            pair TEXT PRIMARY KEY,
            seed INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute("INSERT OR IGNORE INTO schema_version (version) VALUES (1);");
    execute("CREATE INDEX IF NOT EXISTS idx_trades_user ON trades(username, seq);");
}

int SqliteDocumentStore::get_schema_version() {
    auto stmt = prepare("SELECT version FROM schema_version LIMIT 1;");
    int version = 0;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        version = static_cast<int>(get_int64(stmt, 0));
        rc = sqlite3_step(stmt);
    }
    finish_rows(stmt, rc, "read schema version");
    return version;
}

// ============================================================================
// DOCUMENT OPERATIONS
// ============================================================================

std::optional<StoreDocument> SqliteDocumentStore::load() {
    StoreDocument document;
    int rc;

    auto stmt = prepare("SELECT username, balance_micros FROM users;");
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        UserAccount account;
        account.balance = Money::from_micros(get_int64(stmt, 1));
        document.users.emplace(get_text(stmt, 0), std::move(account));
    }
    finish_rows(stmt, rc, "read users");

    stmt = prepare("SELECT pair, seed FROM pair_seeds;");
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        document.pair_seeds[get_text(stmt, 0)] = get_int64(stmt, 1);
    }
    finish_rows(stmt, rc, "read pair seeds");

    stmt = prepare(R"(
        SELECT trade_id, username, pair, side, amount_micros, placed_at, expires_at,
               settled, exit_price, result, settled_at, payout_micros
        FROM trades ORDER BY username, seq;
    )");
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Trade trade;
        trade.trade_id = get_text(stmt, 0);
        std::string username = get_text(stmt, 1);
        trade.pair = get_text(stmt, 2);

        std::string side_text = get_text(stmt, 3);
        auto side = side_from_string(side_text);
        if (!side) {
            finalize(stmt);
            throw StoreError("Trade " + trade.trade_id + " has unknown side '" + side_text + "'");
        }
        trade.side = *side;

        trade.amount = Money::from_micros(get_int64(stmt, 4));
        trade.placed_at = get_double(stmt, 5);
        trade.expires_at = get_double(stmt, 6);
        trade.settled = get_int64(stmt, 7) != 0;
        if (!is_null(stmt, 8)) trade.exit_price = get_double(stmt, 8);
        if (!is_null(stmt, 9)) {
            auto result = result_from_string(get_text(stmt, 9));
            if (!result) {
                finalize(stmt);
                throw StoreError("Trade " + trade.trade_id + " has unknown result");
            }
            trade.result = *result;
        }
        if (!is_null(stmt, 10)) trade.settled_at = get_double(stmt, 10);
        trade.payout = Money::from_micros(get_int64(stmt, 11));

        document.users[username].trades.push_back(std::move(trade));
    }
    finish_rows(stmt, rc, "read trades");

    if (document.users.empty() && document.pair_seeds.empty()) {
        return std::nullopt;
    }

    if (!document.is_valid()) {
        throw StoreError("Invalid database contents: " + document.validation_error());
    }

    return document;
}

// SQLite locks each statement; the lock file spans a whole load-change-save
std::unique_ptr<StoreLock> SqliteDocumentStore::lock_exclusive() {
    return std::make_unique<FileLock>(db_path_ + ".lock");
}

void SqliteDocumentStore::save(const StoreDocument& document) {
    execute("BEGIN IMMEDIATE TRANSACTION;");

    try {
        execute("DELETE FROM trades;");
        execute("DELETE FROM users;");
        execute("DELETE FROM pair_seeds;");
        insert_rows(document);
        execute("COMMIT;");
    } catch (const StoreError& e) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            spdlog::error("Rollback failed: {}", errmsg ? errmsg : "Unknown error");
        }
        sqlite3_free(errmsg);
        spdlog::error("Document save failed: {}", e.what());
        throw;
    }

    spdlog::debug("Document saved to {}: {} users", db_path_, document.users.size());
}

void SqliteDocumentStore::insert_rows(const StoreDocument& document) {
    auto user_stmt = prepare("INSERT INTO users (username, balance_micros) VALUES (?, ?);");
    for (const auto& [username, account] : document.users) {
        sqlite3_reset(user_stmt);
        bind_text(user_stmt, 1, username);
        bind_int64(user_stmt, 2, account.balance.micros());
        step_done(user_stmt, "insert user");
    }
    finalize(user_stmt);

    auto trade_stmt = prepare(R"(
        INSERT INTO trades (
            trade_id, username, seq, pair, side, amount_micros, placed_at, expires_at,
            settled, exit_price, result, settled_at, payout_micros
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    for (const auto& [username, account] : document.users) {
        int64_t seq = 0;
        for (const auto& trade : account.trades) {
            sqlite3_reset(trade_stmt);
            bind_text(trade_stmt, 1, trade.trade_id);
            bind_text(trade_stmt, 2, username);
            bind_int64(trade_stmt, 3, seq++);
            bind_text(trade_stmt, 4, trade.pair);
            bind_text(trade_stmt, 5, side_to_string(trade.side));
            bind_int64(trade_stmt, 6, trade.amount.micros());
            bind_double(trade_stmt, 7, trade.placed_at);
            bind_double(trade_stmt, 8, trade.expires_at);
            bind_int64(trade_stmt, 9, trade.settled ? 1 : 0);
            if (trade.exit_price) bind_double(trade_stmt, 10, *trade.exit_price);
            else bind_null(trade_stmt, 10);
            if (trade.result) bind_text(trade_stmt, 11, result_to_string(*trade.result));
            else bind_null(trade_stmt, 11);
            if (trade.settled_at) bind_double(trade_stmt, 12, *trade.settled_at);
            else bind_null(trade_stmt, 12);
            bind_int64(trade_stmt, 13, trade.payout.micros());
            step_done(trade_stmt, "insert trade");
        }
    }
    finalize(trade_stmt);

    auto seed_stmt = prepare("INSERT INTO pair_seeds (pair, seed) VALUES (?, ?);");
    for (const auto& [pair, seed] : document.pair_seeds) {
        sqlite3_reset(seed_stmt);
        bind_text(seed_stmt, 1, pair);
        bind_int64(seed_stmt, 2, seed);
        step_done(seed_stmt, "insert pair seed");
    }
    finalize(seed_stmt);
}

} // namespace desk
