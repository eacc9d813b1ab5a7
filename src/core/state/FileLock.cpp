#include "core/state/FileLock.h"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace revscan {
namespace core {

int FileLock::openLockFile(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot open lock file " + path.string());
    }
    return fd;
}

std::optional<FileLock> FileLock::tryAcquire(const std::filesystem::path& path) {
    FileLock lock(openLockFile(path));
    while (::flock(lock.fd_, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            return std::nullopt;
        }
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "flock failed on " + path.string());
        }
    }
    return std::optional<FileLock>(std::move(lock));
}

FileLock FileLock::acquire(const std::filesystem::path& path) {
    FileLock lock(openLockFile(path));
    while (::flock(lock.fd_, LOCK_EX) != 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "flock failed on " + path.string());
        }
    }
    return lock;
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileLock::~FileLock() {
    release();
}

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace core
} // namespace revscan
