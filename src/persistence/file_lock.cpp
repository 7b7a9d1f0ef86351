#include "persistence/file_lock.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace desk {

FileLock::FileLock(const std::string& path)
    : path_(path)
{
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) {
        throw StoreError("Cannot open lock file " + path_ + ": " + std::strerror(errno));
    }

    int rc;
    do {
        rc = ::flock(fd_, LOCK_EX);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        std::string error = std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        throw StoreError("Cannot lock " + path_ + ": " + error);
    }

    spdlog::trace("Acquired store lock {}", path_);
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

} // namespace desk
