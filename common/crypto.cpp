// ============================================================
// crypto.cpp -- Password-based chunk encryption (PBKDF2 + AES-256-CBC)
// ============================================================

#include "crypto.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <stdexcept>
#include <cstring>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

using namespace crypto;

namespace {

// Wipes a fixed buffer when leaving scope
class CleanseGuard {
public:
    CleanseGuard(void* p, size_t n) : p_(p), n_(n) {}
    ~CleanseGuard() { OPENSSL_cleanse(p_, n_); }

    CleanseGuard(const CleanseGuard&) = delete;
    CleanseGuard& operator=(const CleanseGuard&) = delete;

private:
    void*  p_;
    size_t n_;
};

// Owns an EVP cipher context
struct CipherCtx {
    EVP_CIPHER_CTX* ctx;
    CipherCtx() : ctx(EVP_CIPHER_CTX_new()) {
        if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }
    ~CipherCtx() { EVP_CIPHER_CTX_free(ctx); }

    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

void wipe_string(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    s.clear();
}

void random_bytes(u8* out, size_t n, const char* what) {
    if (RAND_bytes(out, (int)n) != 1) {
        throw std::runtime_error(std::string("RAND_bytes failed for ") + what);
    }
}

} // namespace

// ============================================================
// Password
// ============================================================

Password::Password(std::string&& s) : value_(s) {
    wipe_string(s);
}

Password::~Password() {
    clear();
}

// Copy then wipe: a std::string move can leave the old SSO buffer intact
Password::Password(Password&& o) : value_(o.value_) {
    o.clear();
}

Password& Password::operator=(Password&& o) {
    if (this != &o) {
        clear();
        value_ = o.value_;
        o.clear();
    }
    return *this;
}

void Password::clear() {
    wipe_string(value_);
}

void crypto::validate_new_password(const Password& pw) {
    if (!text::is_valid_utf8(pw.str())) {
        throw InputError("Password is not valid UTF-8");
    }
    if (text::utf8_length(pw.str()) < MIN_PASSWORD_CHARS) {
        throw InputError("Password must be at least " + std::to_string(MIN_PASSWORD_CHARS) +
                         " characters");
    }
}

bool crypto::same_password(const Password& a, const Password& b) {
    if (a.str().size() != b.str().size()) return false;
    return CRYPTO_memcmp(a.str().data(), b.str().data(), a.str().size()) == 0;
}

// ============================================================
// CryptoEngine
// ============================================================

CryptoEngine::CryptoEngine(int iterations) : iterations_(iterations) {
    if (iterations_ < 1) throw std::invalid_argument("PBKDF2 iteration count must be positive");
}

void CryptoEngine::derive_key(const Password& pw, const u8* salt, u8* key_out) const {
    if (PKCS5_PBKDF2_HMAC(pw.str().data(), (int)pw.str().size(),
                          salt, (int)SALT_SIZE,
                          iterations_,
                          EVP_sha256(),
                          (int)KEY_SIZE, key_out) != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }
}

EncryptedBlob CryptoEngine::encrypt(const std::string& plaintext, const Password& pw) const {
    if (pw.empty()) throw InputError("Encryption requires a password");

    EncryptedBlob blob;
    random_bytes(blob.salt.data(), SALT_SIZE, "salt");
    random_bytes(blob.iv.data(), IV_SIZE, "iv");

    std::array<u8, KEY_SIZE> key;
    CleanseGuard key_guard(key.data(), key.size());
    derive_key(pw, blob.salt.data(), key.data());

    CipherCtx c;
    if (EVP_EncryptInit_ex(c.ctx, EVP_aes_256_cbc(), nullptr, key.data(), blob.iv.data()) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }

    // PKCS7 always adds 1..16 bytes
    blob.ciphertext.resize(plaintext.size() + BLOCK_SIZE);
    int outl = 0, finl = 0;
    if (EVP_EncryptUpdate(c.ctx, blob.ciphertext.data(), &outl,
                          reinterpret_cast<const u8*>(plaintext.data()),
                          (int)plaintext.size()) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    if (EVP_EncryptFinal_ex(c.ctx, blob.ciphertext.data() + outl, &finl) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    blob.ciphertext.resize((size_t)(outl + finl));
    return blob;
}

std::string CryptoEngine::decrypt(const EncryptedBlob& blob, const Password& pw) const {
    if (pw.empty()) throw DecryptionError("No password supplied");
    if (blob.ciphertext.empty() || blob.ciphertext.size() % BLOCK_SIZE != 0) {
        throw FormatError("Ciphertext length " + std::to_string(blob.ciphertext.size()) +
                          " is not a positive multiple of the block size");
    }

    std::array<u8, KEY_SIZE> key;
    CleanseGuard key_guard(key.data(), key.size());
    derive_key(pw, blob.salt.data(), key.data());

    CipherCtx c;
    if (EVP_DecryptInit_ex(c.ctx, EVP_aes_256_cbc(), nullptr, key.data(), blob.iv.data()) != 1) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }

    std::string out(blob.ciphertext.size() + BLOCK_SIZE, '\0');
    int outl = 0, finl = 0;
    if (EVP_DecryptUpdate(c.ctx, reinterpret_cast<u8*>(&out[0]), &outl,
                          blob.ciphertext.data(), (int)blob.ciphertext.size()) != 1) {
        wipe_string(out);
        throw DecryptionError("Decryption failed");
    }
    if (EVP_DecryptFinal_ex(c.ctx, reinterpret_cast<u8*>(&out[0]) + outl, &finl) != 1) {
        wipe_string(out);
        throw DecryptionError("Decryption failed: invalid padding (wrong password or corrupted data)");
    }
    out.resize((size_t)(outl + finl));

    if (!text::is_valid_utf8(out)) {
        wipe_string(out);
        throw DecryptionError("Decryption failed: output is not UTF-8 (wrong password or corrupted data)");
    }
    return out;
}

std::string CryptoEngine::encode_for_transport(const EncryptedBlob& blob) {
    std::vector<u8> raw;
    raw.reserve(SALT_SIZE + IV_SIZE + blob.ciphertext.size());
    raw.insert(raw.end(), blob.salt.begin(), blob.salt.end());
    raw.insert(raw.end(), blob.iv.begin(), blob.iv.end());
    raw.insert(raw.end(), blob.ciphertext.begin(), blob.ciphertext.end());
    return base64::encode(raw.data(), raw.size());
}

EncryptedBlob CryptoEngine::decode_from_transport(const std::string& text) {
    std::vector<u8> raw = base64::decode(text);
    if (raw.size() < SALT_SIZE + IV_SIZE) {
        throw FormatError("Encrypted payload too short: " + std::to_string(raw.size()) +
                          " bytes, need at least " + std::to_string(SALT_SIZE + IV_SIZE));
    }
    EncryptedBlob blob;
    std::memcpy(blob.salt.data(), raw.data(), SALT_SIZE);
    std::memcpy(blob.iv.data(), raw.data() + SALT_SIZE, IV_SIZE);
    blob.ciphertext.assign(raw.begin() + SALT_SIZE + IV_SIZE, raw.end());
    return blob;
}

// ============================================================
// base64
// ============================================================

std::string base64::encode(const u8* data, size_t len) {
    if (len == 0) return "";
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<u8*>(&out[0]), data, (int)len);
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize((size_t)n);
    return out;
}

std::vector<u8> base64::decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
        if (!ok) throw FormatError("Invalid base64 character in payload");
        clean.push_back((char)c);
    }
    if (clean.empty()) return {};
    if (clean.size() % 4 != 0) throw FormatError("Invalid base64 length");

    size_t pad = 0;
    if (clean[clean.size() - 1] == '=') {
        ++pad;
        if (clean[clean.size() - 2] == '=') ++pad;
    }
    // '=' only allowed as trailing padding
    if (clean.find('=') < clean.size() - pad) throw FormatError("Invalid base64 padding");

    std::vector<u8> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const u8*>(clean.data()), (int)clean.size());
    if (n < 0) throw FormatError("Invalid base64 payload");
    out.resize((size_t)n - pad);
    return out;
}
