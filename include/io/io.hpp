#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <sys/types.h>

namespace codepush {

inline constexpr std::size_t kIoChunkSize = 64 * 1024;

// Pull-style byte source feeding the archiver, hashing and uploads.
class IReader {
public:
    virtual ~IReader() = default;
    // Bytes read, 0 at end of stream, -1 with errno set on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

using ChunkFn = std::function<Result(std::span<const std::uint8_t>)>;

// Drains `reader` in kIoChunkSize pieces. Stops at the first failing
// callback; `total`, when given, receives the number of bytes consumed.
Result ForEachChunk(IReader& reader, const ChunkFn& fn, std::uint64_t* total = nullptr);

} // namespace codepush
