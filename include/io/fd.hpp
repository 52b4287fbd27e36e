#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <sys/types.h>

namespace codepush {

// Owning file descriptor; closed on destruction.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added. The error message names the path.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    // Writes all of `data`, retrying short writes and EINTR.
    Result WriteAll(std::string_view data);

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);
    int Release();
    void Close();

private:
    int fd_{-1};
};

} // namespace codepush
