#pragma once

#include <cstdint>
#include <string>

namespace codepush {

// Binary units: "512 B", "1.5 KB", "3.0 MB".
std::string FormatBytes(std::int64_t bytes);

} // namespace codepush
