#pragma once

#include <string>

namespace codepush {

// Owns a path on disk and unlinks it on destruction.
class ScopedFile {
public:
    ScopedFile() = default;
    explicit ScopedFile(std::string path);
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;
    ScopedFile(ScopedFile&& other) noexcept;
    ScopedFile& operator=(ScopedFile&& other) noexcept;
    ~ScopedFile();

    const std::string& Path() const { return path_; }
    bool Empty() const { return path_.empty(); }

    // Stop owning the path without removing it.
    std::string Release();
    void Remove();

private:
    std::string path_;
};

} // namespace codepush
