#include "persistence/json_file_store.hpp"
#include "persistence/file_lock.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace desk {

JsonFileStore::JsonFileStore(const Config& config)
    : config_(config)
{
    std::filesystem::path p(config_.path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::warn("Could not create data directory {}: {}",
                         p.parent_path().string(), ec.message());
        }
    }
    spdlog::info("JsonFileStore initialized: path={}, backups={}",
                 config_.path, config_.max_backups);
}

std::optional<StoreDocument> JsonFileStore::load() {
    auto backups = list_backups();

    if (!file_exists() && backups.empty()) {
        return std::nullopt;
    }

    if (file_exists()) {
        try {
            return read_file(config_.path);
        } catch (const StoreError& e) {
            spdlog::warn("Primary data file unreadable: {}", e.what());
        }
    }

    for (const auto& backup : backups) {
        try {
            auto document = read_file(backup);
            spdlog::warn("Loaded data from backup: {}", backup);
            return document;
        } catch (const StoreError& e) {
            spdlog::warn("Backup unreadable: {}", e.what());
        }
    }

    throw StoreError("No readable data file at " + config_.path);
}

void JsonFileStore::save(const StoreDocument& document) {
    std::string text;
    try {
        nlohmann::json j = document;
        text = j.dump(config_.indent);
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string("Failed to serialize document: ") + e.what());
    }

    if (config_.max_backups > 0 && file_exists()) {
        rotate_backups();
    }
    write_atomic(config_.path, text);
    spdlog::debug("Data saved: {} users, {} pairs", document.users.size(),
                  document.pair_seeds.size());
}

std::unique_ptr<StoreLock> JsonFileStore::lock_exclusive() {
    return std::make_unique<FileLock>(config_.path + ".lock");
}

std::vector<std::string> JsonFileStore::list_backups() const {
    std::vector<std::string> backups;

    for (int i = 0; i < config_.max_backups; ++i) {
        std::string path = backup_path(i);
        if (std::filesystem::exists(path)) {
            backups.push_back(path);
        }
    }

    // Index order is newest first
    return backups;
}

bool JsonFileStore::file_exists() const {
    return std::filesystem::exists(config_.path);
}

std::string JsonFileStore::backup_path(int index) const {
    return config_.path + ".bak" + std::to_string(index);
}

void JsonFileStore::write_atomic(const std::string& path, const std::string& text) const {
    std::string temp = path + ".tmp";

    try {
        std::ofstream file(temp);
        if (!file) {
            throw StoreError("Failed to open temp file: " + temp);
        }

        file << text;
        file.close();

        if (!file) {
            throw StoreError("Failed to write temp file: " + temp);
        }

        // Atomic rename
        std::filesystem::rename(temp, path);

    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError(std::string("Data write failed: ") + e.what());
    }
}

StoreDocument JsonFileStore::read_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        throw StoreError("Failed to open data file: " + path);
    }

    StoreDocument document;
    try {
        nlohmann::json j;
        file >> j;
        document = j.get<StoreDocument>();
    } catch (const std::exception& e) {
        throw StoreError("Failed to parse data file " + path + ": " + e.what());
    }

    if (!document.is_valid()) {
        throw StoreError("Invalid data file " + path + ": " + document.validation_error());
    }

    return document;
}

void JsonFileStore::rotate_backups() {
    try {
        // Shift existing backups
        for (int i = config_.max_backups - 1; i > 0; --i) {
            std::string from = backup_path(i - 1);
            std::string to = backup_path(i);

            if (std::filesystem::exists(from)) {
                std::filesystem::rename(from, to);
            }
        }

        std::filesystem::copy_file(config_.path, backup_path(0),
                                   std::filesystem::copy_options::overwrite_existing);
    } catch (const std::filesystem::filesystem_error& e) {
        throw StoreError(std::string("Backup rotation failed: ") + e.what());
    }
}

} // namespace desk
