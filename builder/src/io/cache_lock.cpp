#include "io/cache_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace muslforge::io {

CacheLock::~CacheLock() {
    release();
}

CacheLock::CacheLock(CacheLock &&other) noexcept : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

CacheLock &CacheLock::operator=(CacheLock &&other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

bool CacheLock::acquire(const std::filesystem::path &lockFile, bool wait, std::string &error) {
    release();

    const int fd = open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "cannot open " + lockFile.string() + ": " + std::strerror(errno);
        return false;
    }

    const int op = wait ? LOCK_EX : (LOCK_EX | LOCK_NB);
    while (flock(fd, op) != 0) {
        if (errno == EINTR) {
            continue;
        }
        error = (errno == EWOULDBLOCK ? "cache is locked by another invocation: " : "cannot lock ") +
                lockFile.string();
        close(fd);
        return false;
    }

    fd_ = fd;
    path_ = lockFile;
    return true;
}

void CacheLock::release() {
    if (fd_ < 0) {
        return;
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

} // namespace muslforge::io
