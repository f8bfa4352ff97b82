#pragma once

// ============================================================
// crypto.hpp -- Password-based chunk encryption (PBKDF2 + AES-256-CBC)
// ============================================================

#include "platform.hpp"
#include <array>
#include <string>
#include <vector>

namespace crypto {

constexpr size_t SALT_SIZE  = 16;
constexpr size_t IV_SIZE    = 16;
constexpr size_t KEY_SIZE   = 32;
constexpr size_t BLOCK_SIZE = 16;
constexpr int    PBKDF2_ITERATIONS  = 100000;
constexpr size_t MIN_PASSWORD_CHARS = 8;

// Secret held in memory only for the operation that needs it.
// Move-only; the buffer is wiped on clear() and destruction.
class Password {
public:
    Password() = default;
    explicit Password(std::string&& s);
    ~Password();

    Password(Password&& o);
    Password& operator=(Password&& o);

    Password(const Password&) = delete;
    Password& operator=(const Password&) = delete;

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }
    void clear();

private:
    std::string value_;
};

// Throws InputError if the password is shorter than MIN_PASSWORD_CHARS
// code points.
void validate_new_password(const Password& pw);

// Constant-time comparison
bool same_password(const Password& a, const Password& b);

struct EncryptedBlob {
    std::array<u8, SALT_SIZE> salt{};
    std::array<u8, IV_SIZE>   iv{};
    std::vector<u8>           ciphertext;
};

class CryptoEngine {
public:
    explicit CryptoEngine(int iterations = PBKDF2_ITERATIONS);

    int iterations() const { return iterations_; }

    // Fresh random salt and IV on every call
    EncryptedBlob encrypt(const std::string& plaintext, const Password& pw) const;

    // Throws DecryptionError on bad padding, bad length or non-UTF-8 output
    std::string decrypt(const EncryptedBlob& blob, const Password& pw) const;

    // base64(salt || iv || ciphertext)
    static std::string encode_for_transport(const EncryptedBlob& blob);

    // Throws FormatError if the text is not base64 or decodes to < 32 bytes
    static EncryptedBlob decode_from_transport(const std::string& text);

private:
    void derive_key(const Password& pw, const u8* salt, u8* key_out) const;

    int iterations_;
};

} // namespace crypto

namespace base64 {

std::string encode(const u8* data, size_t len);

// Whitespace is skipped; any other non-alphabet char or bad length throws FormatError
std::vector<u8> decode(const std::string& text);

} // namespace base64
