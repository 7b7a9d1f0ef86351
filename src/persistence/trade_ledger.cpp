#include "persistence/trade_ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace desk {

TradeLedger::TradeLedger(const std::string& path)
    : base_path_(path)
    , current_path_(path)
{
    open_file();
}

TradeLedger::~TradeLedger() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void TradeLedger::open_file() {
    // Create directory if needed
    std::filesystem::path p(current_path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    file_.open(current_path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open trade ledger: {}", current_path_);
        return;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(current_path_, ec);
    bytes_written_ = ec ? 0 : static_cast<size_t>(size);
    spdlog::info("Trade ledger opened: {}", current_path_);
}

void TradeLedger::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }

    // Invalid UTF-8 in user-supplied names is replaced rather than thrown
    std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    file_ << line;
    file_.flush();
    if (!file_) {
        spdlog::error("Trade ledger write failed: {}", current_path_);
        file_.clear();
        return;
    }

    bytes_written_ += line.size();
    if (bytes_written_ >= MAX_FILE_SIZE) {
        rotate_locked();
    }
}

void TradeLedger::record_open(const std::string& user_id, const Trade& trade) {
    record_event("trade_opened", user_id, trade);
}

void TradeLedger::record_settlement(const std::string& user_id, const Trade& trade) {
    record_event("trade_settled", user_id, trade);
}

void TradeLedger::record_event(const std::string& event_type, const std::string& user_id,
                               const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["user"] = user_id;
    j["data"] = data;
    write_line(j);
}

std::vector<TradeLedger::Event> TradeLedger::read_events(const std::string& event_type) const {
    std::vector<Event> events;

    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = current_path_;
    }

    std::ifstream file(path);
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            spdlog::warn("Skipping malformed ledger line {} in {}", line_no, path);
            continue;
        }

        Event event;
        event.event_type = j.value("event_type", "");
        if (!event_type.empty() && event.event_type != event_type) {
            continue;
        }
        event.timestamp = j.value("timestamp", "");
        event.user_id = j.value("user", "");
        if (j.contains("data")) {
            event.data = j["data"];
        }
        events.push_back(std::move(event));
    }

    return events;
}

void TradeLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void TradeLedger::rotate() {
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_locked();
}

void TradeLedger::rotate_locked() {
    if (file_.is_open()) {
        file_.close();
    }

    // Create new filename with timestamp
    auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = *std::gmtime(&now_time);

    std::ostringstream ss;
    ss << base_path_ << "." << std::put_time(&tm, "%Y%m%d_%H%M%S") << "." << now_ms() % 1000;
    current_path_ = ss.str();

    open_file();
}

size_t TradeLedger::file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return 0;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(current_path_, ec);
    return ec ? 0 : static_cast<size_t>(size);
}

bool TradeLedger::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

std::string TradeLedger::current_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_path_;
}

} // namespace desk
