#pragma once

// ============================================================
// hash.hpp -- SHA-256 integrity digests and xxHash3 fingerprints
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#include <openssl/evp.h>

// xxh3_128 fingerprints scanned payloads so duplicate scans can be dropped
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

constexpr size_t SHA256_SIZE      = 32;
constexpr size_t CHUNK_HASH_CHARS = 16;
constexpr size_t FILE_HASH_CHARS  = 64;

using Digest256 = std::array<u8, SHA256_SIZE>;

// 16-byte (128-bit) fingerprint
using Hash128 = std::array<u8, 16>;

inline std::string to_hex(const u8* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// Streaming SHA-256 over EVP
class Sha256Stream {
public:
    Sha256Stream() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    ~Sha256Stream() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1)
            throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1)
            throw std::runtime_error("EVP_DigestUpdate failed");
    }

    void update(const std::string& s) { update(s.data(), s.size()); }

    // Finalizes; call reset() before reusing the stream
    Digest256 digest() {
        Digest256 out{};
        unsigned int n = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &n) != 1 || n != SHA256_SIZE)
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        return out;
    }

    std::string hex_digest() {
        Digest256 d = digest();
        return to_hex(d.data(), d.size());
    }

private:
    EVP_MD_CTX* ctx_;
};

inline std::string sha256_hex(const void* data, size_t len) {
    Sha256Stream s;
    s.update(data, len);
    return s.hex_digest();
}

inline std::string sha256_hex(const std::string& s) {
    return sha256_hex(s.data(), s.size());
}

// First 16 hex chars of SHA-256 over the chunk's UTF-8 bytes
inline std::string chunk_hash(const std::string& text) {
    return sha256_hex(text).substr(0, CHUNK_HASH_CHARS);
}

// Full 64 hex chars of SHA-256 over the whole file text
inline std::string file_hash(const std::string& text) {
    return sha256_hex(text);
}

inline bool is_lower_hex(const std::string& s, size_t expected_len) {
    if (s.size() != expected_len) return false;
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

// Compute xxh3_128 of a memory buffer, stored big-endian for determinism
inline Hash128 xxh3_128(const void* data, size_t len) {
    XXH128_hash_t h = XXH3_128bits(data, len);
    Hash128 result;
    u64 lo = h.low64;
    u64 hi = h.high64;
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(hi >> (56 - 8 * i));
        result[8 + i] = (u8)(lo >> (56 - 8 * i));
    }
    return result;
}

inline Hash128 xxh3_128(const std::string& s) {
    return xxh3_128(s.data(), s.size());
}

} // namespace hash
