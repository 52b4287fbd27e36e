#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

struct evp_md_ctx_st;

namespace codepush {

// Incremental SHA-256 over OpenSSL EVP. Once Update fails or Finish has
// run, the hasher stays unusable.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool Update(std::span<const std::uint8_t> data);
    // Lowercase hex digest, or an empty string on failure.
    std::string Finish();

private:
    struct CtxFree {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxFree> ctx_;
};

std::string Sha256Hex(std::span<const std::uint8_t> data);

Result Sha256HexStream(IReader& reader, std::string& out_hex);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

} // namespace codepush
