#include "io/scoped_file.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace codepush {

ScopedFile::ScopedFile(std::string path) : path_(std::move(path)) {}

ScopedFile::ScopedFile(ScopedFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedFile& ScopedFile::operator=(ScopedFile&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScopedFile::~ScopedFile() { Remove(); }

std::string ScopedFile::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

void ScopedFile::Remove() {
    if (path_.empty()) return;
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LogWarn("failed to remove %s: %s", path_.c_str(), std::strerror(errno));
    } else {
        LogDebug("removed %s", path_.c_str());
    }
    path_.clear();
}

} // namespace codepush
