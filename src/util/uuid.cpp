#include "util/uuid.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

namespace codepush {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool DecodeHexPair(char hi, char lo, std::uint8_t& out) {
    const int h = HexValue(hi);
    const int l = HexValue(lo);
    if (h < 0 || l < 0) return false;
    out = static_cast<std::uint8_t>((h << 4) | l);
    return true;
}

bool ParseCanonical(std::string_view s, Uuid& out) {
    if (s.size() != 36) return false;
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') return false;
    size_t pos = 0;
    for (auto& b : out) {
        if (s[pos] == '-') ++pos;
        if (!DecodeHexPair(s[pos], s[pos + 1], b)) return false;
        pos += 2;
    }
    return true;
}

bool ParseCompact(std::string_view s, Uuid& out) {
    if (s.size() != 32) return false;
    for (size_t i = 0; i < out.size(); ++i) {
        if (!DecodeHexPair(s[i * 2], s[i * 2 + 1], out[i])) return false;
    }
    return true;
}

} // namespace

Result GenerateUuidV4(Uuid& out) {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return Result::Fail(kErrIo,
                            "RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    out[6] = static_cast<std::uint8_t>((out[6] & 0x0F) | 0x40);
    out[8] = static_cast<std::uint8_t>((out[8] & 0x3F) | 0x80);
    return Result::Ok();
}

Result GenerateUuidV4String(std::string& out) {
    Uuid id{};
    auto r = GenerateUuidV4(id);
    if (!r.ok) return r;
    out = ToString(id);
    return Result::Ok();
}

std::string ToString(const Uuid& id) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[(id[i] >> 4) & 0xF]);
        out.push_back(kHex[id[i] & 0xF]);
    }
    return out;
}

bool ParseUuid(std::string_view s, Uuid& out) {
    constexpr std::string_view kUrnPrefix = "urn:uuid:";
    switch (s.size()) {
        case 36:
            return ParseCanonical(s, out);
        case 38:
            if (s.front() != '{' || s.back() != '}') return false;
            return ParseCanonical(s.substr(1, 36), out);
        case 45:
            if (s.substr(0, kUrnPrefix.size()) != kUrnPrefix) return false;
            return ParseCanonical(s.substr(kUrnPrefix.size()), out);
        case 32:
            return ParseCompact(s, out);
        default:
            return false;
    }
}

bool IsUuid(std::string_view s) {
    Uuid tmp{};
    return ParseUuid(s, tmp);
}

} // namespace codepush
