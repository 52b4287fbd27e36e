#include "io/io.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

namespace codepush {

Result ForEachChunk(IReader& reader, const ChunkFn& fn, std::uint64_t* total) {
    std::vector<std::uint8_t> buf(kIoChunkSize);
    std::uint64_t consumed = 0;
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            const int e = errno != 0 ? errno : EIO;
            return Result::Fail(e, std::string("read failed: ") + std::strerror(e));
        }
        auto r = fn(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!r.ok) return r;
        consumed += static_cast<std::uint64_t>(n);
    }
    if (total) *total = consumed;
    return Result::Ok();
}

} // namespace codepush
