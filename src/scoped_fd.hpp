#pragma once

// Internal header — not installed.
// RAII owner of a POSIX file descriptor, plus the write helpers the file
// store and the audit trail share.

#include <issuehub-cpp/error.hpp>

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

namespace issuehub_cpp::detail {

class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_{fd} {}

    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    auto operator=(const ScopedFd&) -> ScopedFd& = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_{other.release()} {}
    auto operator=(ScopedFd&& other) noexcept -> ScopedFd& {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    auto get() const -> int { return fd_; }
    auto valid() const -> bool { return fd_ >= 0; }

    // Release ownership; caller must close.
    auto release() -> int {
        auto fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

inline auto errno_message(std::string_view what, const std::string& path) -> std::string {
    return std::string{what} + " " + path + ": " + std::strerror(errno);
}

// Open `path` with `flags`, throwing `kind` on failure.
inline auto open_file(const std::string& path, int flags, ErrorKind kind) -> ScopedFd {
    auto fd = ScopedFd{::open(path.c_str(), flags | O_CLOEXEC, 0644)};
    if (!fd.valid()) throw Exception{kind, errno_message("cannot open", path)};
    return fd;
}

// Write all of `data`, retrying on short writes and EINTR.
inline void write_all(const ScopedFd& fd, std::string_view data,
                      const std::string& path, ErrorKind kind) {
    while (!data.empty()) {
        auto n = ::write(fd.get(), data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            throw Exception{kind, errno_message("cannot write", path)};
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

inline void sync_file(const ScopedFd& fd, const std::string& path, ErrorKind kind) {
    if (::fsync(fd.get()) != 0) {
        throw Exception{kind, errno_message("cannot fsync", path)};
    }
}

}  // namespace issuehub_cpp::detail
