#pragma once

// ============================================================
// chunk_codec.hpp -- Framing of chunks as text wire records
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "crypto.hpp"
#include <string>

namespace codec {

// Present only when the record is to be encrypted
struct Encryption {
    const crypto::CryptoEngine& engine;
    const crypto::Password&     password;
};

// Hash the plaintext body and (if enc != nullptr) encrypt it.
// Throws InputError for a filename that cannot be framed.
WireRecord make_record(const Chunk& chunk, const Encryption* enc);

// Exact wire text for a record
std::string render(const WireRecord& rec);

inline std::string encode(const Chunk& chunk, const Encryption* enc) {
    return render(make_record(chunk, enc));
}

// Parse one wire record. Hashes are not verified here.
// Throws FormatError for anything that is not exactly one of the two shapes.
WireRecord decode(const std::string& text);

// Plaintext body of a record; decrypts ENCRYPTED payloads.
// Throws DecryptionError if a password is needed but enc is nullptr.
std::string open_payload(const WireRecord& rec, const Encryption* enc);

// "{stem}[_encrypted]_part_{II}_of_{TT}{ext}"
std::string chunk_file_name(const std::string& filename, u32 index, u32 total,
                            bool encrypted, const std::string& ext = ".txt");

// Reject names that cannot round-trip through a header line
void validate_filename(const std::string& filename);

} // namespace codec
