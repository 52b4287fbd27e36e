#pragma once

#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace codepush {

using Uuid = std::array<std::uint8_t, 16>;

// Random RFC 4122 version 4 UUID from the OpenSSL CSPRNG.
Result GenerateUuidV4(Uuid& out);
Result GenerateUuidV4String(std::string& out);

// Canonical lowercase 8-4-4-4-12 form.
std::string ToString(const Uuid& id);

// Accepts xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, the same wrapped in {} or
// prefixed with urn:uuid:, and 32 hex digits without hyphens.
bool ParseUuid(std::string_view s, Uuid& out);
bool IsUuid(std::string_view s);

} // namespace codepush
