#pragma once

#include <string>
#include "persistence/document_store.hpp"

namespace desk {

/**
 * Exclusive flock(2) on a lock file beside the data, held for the lifetime
 * of the object. Serializes load-mutate-save between processes sharing one
 * data path. The lock file is left in place.
 */
class FileLock : public StoreLock {
public:
    // Blocks until the lock is granted; throws StoreError if it cannot be taken
    explicit FileLock(const std::string& path);
    ~FileLock() override;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
};

} // namespace desk
