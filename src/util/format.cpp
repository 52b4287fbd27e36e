#include "util/format.hpp"

#include <cstdio>

namespace codepush {

std::string FormatBytes(std::int64_t bytes) {
    constexpr std::int64_t kUnit = 1024;
    if (bytes < kUnit) return std::to_string(bytes) + " B";

    std::int64_t div = kUnit;
    int exp = 0;
    for (std::int64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
        div *= kUnit;
        ++exp;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

} // namespace codepush
