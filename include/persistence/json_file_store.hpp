#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "persistence/document_store.hpp"

namespace desk {

/**
 * JSON document on disk.
 *
 * - Writes go to a temp file that is renamed over the target
 * - The previous file is rotated into numbered backups before each write
 * - load() falls back to the newest readable backup if the primary is corrupt
 */
class JsonFileStore : public DocumentStore {
public:
    struct Config {
        std::string path{"./data/data.json"};
        int max_backups{3};
        int indent{2};
    };

    JsonFileStore() : JsonFileStore(Config{}) {}
    explicit JsonFileStore(const Config& config);

    std::optional<StoreDocument> load() override;
    void save(const StoreDocument& document) override;
    std::unique_ptr<StoreLock> lock_exclusive() override;
    std::string describe() const override { return "json:" + config_.path; }

    // File management
    std::vector<std::string> list_backups() const;
    bool file_exists() const;

private:
    Config config_;

    std::string backup_path(int index) const;

    void write_atomic(const std::string& path, const std::string& text) const;
    StoreDocument read_file(const std::string& path) const;
    void rotate_backups();
};

} // namespace desk
