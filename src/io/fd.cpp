#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace codepush {

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "failed to open " + path + " (" + std::strerror(e) + ")");
    }
    out.Reset(fd);
    return Result::Ok();
}

Result Fd::WriteAll(std::string_view data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            return Result::Fail(e, std::string("write failed (") + std::strerror(e) + ")");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

void Fd::Reset(int fd) {
    if (fd == fd_) return;
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

} // namespace codepush
