#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace codepush {

Result FileReader::Open(std::string path, FileReader& out) {
    Fd fd;
    auto r = Fd::Open(path, O_RDONLY, 0, fd);
    if (!r.ok) return r;

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "fstat " + path + " failed (" + std::strerror(e) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::Fail(EISDIR, path + " is a directory");
    }

    out.size_ = S_ISREG(st.st_mode) ? std::optional<std::uint64_t>(st.st_size) : std::nullopt;
    out.fd_ = std::move(fd);
    out.path_ = std::move(path);
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    if (!fd_.Valid()) {
        errno = EBADF;
        return -1;
    }
    ssize_t n;
    do {
        n = ::read(fd_.Get(), out.data(), out.size());
    } while (n < 0 && errno == EINTR);
    return n;
}

} // namespace codepush
