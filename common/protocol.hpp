#pragma once

// protocol.hpp -- Chunk wire record definitions for qrcp
//
// Unencrypted:
//   --BEGIN part_{II}_of_{TT} file: {name} chunk_hash: {h16} file_hash: {h64}--\n
//   {body}--END part_{II}--
// Encrypted:
//   --BEGIN ENCRYPTED part_{II}_of_{TT} file: ... --\n{base64}--END ENCRYPTED part_{II}--
//
// {II}/{TT} are zero-padded to at least two digits.

#include "platform.hpp"
#include <string>

// Largest payload one symbol carries (QR version 40, level L, byte mode)
static constexpr u32    DEFAULT_MAX_SYMBOL_BYTES = 2953;
static constexpr double DEFAULT_SAFETY_MARGIN    = 0.8;
static constexpr u32    DEFAULT_CAPACITY_WARNING = 100;
static constexpr u32    DEFAULT_PARALLEL_THRESHOLD = 3;

// Bytes reserved for framing, salt/iv and padding when a chunk is encrypted
static constexpr u32 ENCRYPTED_CAP_OVERHEAD = 50;
static constexpr u32 MIN_ENCRYPTED_CAP      = 64;

// ---- Wire markers ----
static constexpr const char* WIRE_BEGIN        = "--BEGIN ";
static constexpr const char* WIRE_END          = "--END ";
static constexpr const char* WIRE_ENCRYPTED    = "ENCRYPTED ";
static constexpr const char* WIRE_PART         = "part_";
static constexpr const char* WIRE_OF           = "_of_";
static constexpr const char* WIRE_FILE         = " file: ";
static constexpr const char* WIRE_CHUNK_HASH   = " chunk_hash: ";
static constexpr const char* WIRE_FILE_HASH    = " file_hash: ";
static constexpr const char* WIRE_CLOSE        = "--";

enum class RecordKind : u8 {
    PLAIN     = 0,
    ENCRYPTED = 1,
};

inline const char* record_kind_str(RecordKind k) {
    return k == RecordKind::ENCRYPTED ? "encrypted" : "plain";
}

// Pre-wire chunk: one line-aligned slice of the file text
struct Chunk {
    u32         index = 0;      // 1-based
    u32         total = 0;
    std::string filename;
    std::string body;
    std::string file_hash;      // 64 hex, same for every chunk of a file
};

// Parsed or produced wire record. payload is the plaintext body for PLAIN
// records and base64(salt || iv || ciphertext) for ENCRYPTED ones.
struct WireRecord {
    u32         index = 0;
    u32         total = 0;
    std::string filename;
    std::string chunk_hash;     // of the plaintext body
    std::string file_hash;
    RecordKind  kind = RecordKind::PLAIN;
    std::string payload;

    bool encrypted() const { return kind == RecordKind::ENCRYPTED; }

    bool operator==(const WireRecord& o) const {
        return index == o.index && total == o.total && filename == o.filename &&
               chunk_hash == o.chunk_hash && file_hash == o.file_hash &&
               kind == o.kind && payload == o.payload;
    }
    bool operator!=(const WireRecord& o) const { return !(*this == o); }
};
