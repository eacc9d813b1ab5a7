#pragma once

#include <filesystem>
#include <optional>

namespace revscan {
namespace core {

// Exclusive flock(2) on a side file, held until destruction. Locks belong to
// the open file description, so two instances conflict even in one process.
class FileLock {
public:
    // Empty when another holder has the lock
    static std::optional<FileLock> tryAcquire(const std::filesystem::path& path);

    // Blocks until the lock is granted
    static FileLock acquire(const std::filesystem::path& path);

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    ~FileLock();

private:
    explicit FileLock(int fd) : fd_(fd) {}

    static int openLockFile(const std::filesystem::path& path);
    void release() noexcept;

    int fd_ = -1;
};

} // namespace core
} // namespace revscan
