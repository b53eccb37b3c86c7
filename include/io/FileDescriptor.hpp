#pragma once

#include <cerrno>
#include <unistd.h>

namespace mvx::io {

// Owning POSIX file descriptor.
class FileDescriptor {
public:
    explicit FileDescriptor(const int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    FileDescriptor& operator=(FileDescriptor&& o) noexcept {
        if (this != &o) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    // Explicit close for writers: returns errno, 0 on success.
    int close() noexcept {
        if (fd_ < 0) return 0;
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0 ? 0 : errno;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    int release() noexcept { const int t = fd_; fd_ = -1; return t; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

private:
    int fd_ = -1;
};

}
