#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "store/document.hpp"

namespace desk {

/**
 * Append-only audit trail of trade activity.
 * Writes to JSON lines format for easy processing; the store remains the
 * source of truth and the ledger is never read back into it.
 */
class TradeLedger {
public:
    explicit TradeLedger(const std::string& path);
    ~TradeLedger();

    // Record events
    void record_open(const std::string& user_id, const Trade& trade);
    void record_settlement(const std::string& user_id, const Trade& trade);

    // Generic event recording
    void record_event(const std::string& event_type, const std::string& user_id,
                      const nlohmann::json& data);

    struct Event {
        std::string event_type;
        std::string timestamp;
        std::string user_id;
        nlohmann::json data;
    };

    // Events in the current file, oldest first; empty type matches all
    std::vector<Event> read_events(const std::string& event_type = "") const;

    // Ledger management
    void flush();
    void rotate();  // Continue in a new timestamped file
    size_t file_size() const;
    bool is_open() const;
    std::string current_path() const;

private:
    std::string base_path_;
    std::string current_path_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t bytes_written_{0};

    static constexpr size_t MAX_FILE_SIZE = 100 * 1024 * 1024;  // 100MB

    void open_file();
    void rotate_locked();
    void write_line(const nlohmann::json& j);
};

} // namespace desk
