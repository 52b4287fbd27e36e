#include "util/sha256.hpp"

#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>

namespace codepush {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

} // namespace

void Sha256::CtxFree::operator()(evp_md_ctx_st* ctx) const { EVP_MD_CTX_free(ctx); }

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) ctx_.reset();
}

Sha256::~Sha256() = default;

bool Sha256::Update(std::span<const std::uint8_t> data) {
    if (!ctx_) return false;
    if (data.empty()) return true;
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        ctx_.reset();
        return false;
    }
    return true;
}

std::string Sha256::Finish() {
    if (!ctx_) return {};

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    const bool ok = EVP_DigestFinal_ex(ctx_.get(), md.data(), &len) == 1 && len == 32;
    ctx_.reset();
    if (!ok) return {};

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kHexDigits[md[i] >> 4]);
        hex.push_back(kHexDigits[md[i] & 0x0F]);
    }
    return hex;
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256 h;
    if (!h.Update(data)) return {};
    return h.Finish();
}

Result Sha256HexStream(IReader& reader, std::string& out_hex) {
    Sha256 h;
    auto r = ForEachChunk(reader, [&h](std::span<const std::uint8_t> chunk) {
        if (!h.Update(chunk)) return Result::Fail(kErrIo, "sha256 update failed");
        return Result::Ok();
    });
    if (!r.ok) return r;

    out_hex = h.Finish();
    if (out_hex.empty()) return Result::Fail(kErrIo, "sha256 finalize failed");
    return Result::Ok();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;
    return Sha256HexStream(reader, out_hex).Wrap("hashing " + path);
}

} // namespace codepush
