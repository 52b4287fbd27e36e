#pragma once

#include <cstdint>
#include <string_view>

namespace codepush {

// Snapshot of an in-flight transfer. `total` is 0 when the length is unknown.
struct TransferProgress {
    std::string_view label;
    std::uint64_t sent = 0;
    std::uint64_t total = 0;
};

class IProgress {
public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const TransferProgress& p) = 0;
};

} // namespace codepush
