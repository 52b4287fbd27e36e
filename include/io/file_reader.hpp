#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace codepush {

// Sequential reader over a regular file on disk.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return size_; }

    const std::string& Path() const { return path_; }
    void Close() { fd_.Close(); }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace codepush
