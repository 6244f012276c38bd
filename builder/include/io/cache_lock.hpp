#pragma once

#include <filesystem>
#include <string>

namespace muslforge::io {

// Exclusive advisory lock on a file, held until destruction.
class CacheLock {
public:
    CacheLock() = default;
    ~CacheLock();

    CacheLock(const CacheLock &) = delete;
    CacheLock &operator=(const CacheLock &) = delete;
    CacheLock(CacheLock &&other) noexcept;
    CacheLock &operator=(CacheLock &&other) noexcept;

    // Blocks until the lock is granted unless wait is false.
    bool acquire(const std::filesystem::path &lockFile, bool wait, std::string &error);
    void release();

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path &path() const { return path_; }

private:
    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace muslforge::io
