// ============================================================
// chunk_codec.cpp -- Framing of chunks as text wire records
// ============================================================

#include "chunk_codec.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "text.hpp"
#include "utils.hpp"
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// Cursor over the header line; every expect_* throws FormatError on mismatch
class HeaderReader {
public:
    explicit HeaderReader(const std::string& s) : s_(s) {}

    void expect(const char* lit, const char* what) {
        size_t n = std::strlen(lit);
        if (s_.compare(pos_, n, lit) != 0) {
            throw FormatError(std::string("Malformed record: expected ") + what);
        }
        pos_ += n;
    }

    bool accept(const char* lit) {
        size_t n = std::strlen(lit);
        if (s_.compare(pos_, n, lit) != 0) return false;
        pos_ += n;
        return true;
    }

    u32 number(const char* what) {
        size_t start = pos_;
        while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') ++pos_;
        u32 v = 0;
        if (!utils::parse_u32(s_.substr(start, pos_ - start), v) || v == 0) {
            throw FormatError(std::string("Malformed record: bad ") + what);
        }
        return v;
    }

    size_t pos() const { return pos_; }
    std::string rest() const { return s_.substr(pos_); }

private:
    const std::string& s_;
    size_t pos_{0};
};

std::string strip_envelope(const std::string& text) {
    std::string s = text::strip_bom(text);
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of("\r\n");
    return s.substr(b, e - b + 1);
}

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
}

} // namespace

void codec::validate_filename(const std::string& filename) {
    if (filename.empty()) throw InputError("Empty filename cannot be framed");
    if (filename.find('\n') != std::string::npos || filename.find('\r') != std::string::npos) {
        throw InputError("Filename contains a line break: cannot be framed");
    }
    if (!text::is_valid_utf8(filename)) {
        throw InputError("Filename is not valid UTF-8: " + filename);
    }
}

WireRecord codec::make_record(const Chunk& chunk, const Encryption* enc) {
    validate_filename(chunk.filename);
    if (chunk.index == 0 || chunk.total == 0) {
        throw InputError("Chunk index and total must be positive");
    }
    if (!hash::is_lower_hex(chunk.file_hash, hash::FILE_HASH_CHARS)) {
        throw InputError("Chunk carries an invalid file hash");
    }

    WireRecord rec;
    rec.index      = chunk.index;
    rec.total      = chunk.total;
    rec.filename   = chunk.filename;
    rec.file_hash  = chunk.file_hash;
    rec.chunk_hash = hash::chunk_hash(chunk.body);

    if (enc) {
        rec.kind    = RecordKind::ENCRYPTED;
        rec.payload = crypto::CryptoEngine::encode_for_transport(
                          enc->engine.encrypt(chunk.body, enc->password));
    } else {
        rec.kind    = RecordKind::PLAIN;
        rec.payload = chunk.body;
    }
    return rec;
}

std::string codec::render(const WireRecord& rec) {
    const char* marker = rec.encrypted() ? WIRE_ENCRYPTED : "";
    std::string idx = utils::pad_number(rec.index);

    std::string out;
    out.reserve(rec.payload.size() + rec.filename.size() + 160);
    out += WIRE_BEGIN;
    out += marker;
    out += WIRE_PART;
    out += idx;
    out += WIRE_OF;
    out += utils::pad_number(rec.total);
    out += WIRE_FILE;
    out += rec.filename;
    out += WIRE_CHUNK_HASH;
    out += rec.chunk_hash;
    out += WIRE_FILE_HASH;
    out += rec.file_hash;
    out += WIRE_CLOSE;
    out += '\n';
    out += rec.payload;
    out += WIRE_END;
    out += marker;
    out += WIRE_PART;
    out += idx;
    out += WIRE_CLOSE;
    return out;
}

WireRecord codec::decode(const std::string& text) {
    const std::string s = strip_envelope(text);
    if (s.empty()) throw FormatError("Empty record");

    size_t nl = s.find('\n');
    if (nl == std::string::npos) throw FormatError("Malformed record: no header line");
    const std::string header = s.substr(0, nl);

    WireRecord rec;
    HeaderReader hr(header);
    hr.expect(WIRE_BEGIN, "--BEGIN");
    rec.kind  = hr.accept(WIRE_ENCRYPTED) ? RecordKind::ENCRYPTED : RecordKind::PLAIN;
    hr.expect(WIRE_PART, "part_");
    rec.index = hr.number("index");
    hr.expect(WIRE_OF, "_of_");
    rec.total = hr.number("total");
    hr.expect(WIRE_FILE, "file:");

    // filename may contain spaces: the last " chunk_hash: " delimits it
    std::string rest = hr.rest();
    if (rest.size() < 2 || rest.compare(rest.size() - 2, 2, WIRE_CLOSE) != 0) {
        throw FormatError("Malformed record: header not closed with --");
    }
    rest.resize(rest.size() - 2);

    size_t ch = rest.rfind(WIRE_CHUNK_HASH);
    if (ch == std::string::npos || ch == 0) throw FormatError("Malformed record: missing chunk_hash");
    rec.filename = rest.substr(0, ch);

    std::string hashes = rest.substr(ch + std::strlen(WIRE_CHUNK_HASH));
    size_t fh = hashes.find(WIRE_FILE_HASH);
    if (fh == std::string::npos) throw FormatError("Malformed record: missing file_hash");
    rec.chunk_hash = hashes.substr(0, fh);
    rec.file_hash  = hashes.substr(fh + std::strlen(WIRE_FILE_HASH));

    if (!hash::is_lower_hex(rec.chunk_hash, hash::CHUNK_HASH_CHARS)) {
        throw FormatError("Malformed record: chunk_hash must be 16 lowercase hex chars");
    }
    if (!hash::is_lower_hex(rec.file_hash, hash::FILE_HASH_CHARS)) {
        throw FormatError("Malformed record: file_hash must be 64 lowercase hex chars");
    }

    // Footer: the last "--END " in the record
    const std::string body_and_footer = s.substr(nl + 1);
    size_t end = body_and_footer.rfind(WIRE_END);
    if (end == std::string::npos) throw FormatError("Malformed record: missing --END footer");

    std::string footer = body_and_footer.substr(end);
    HeaderReader fr(footer);
    fr.expect(WIRE_END, "--END");
    bool footer_enc = fr.accept(WIRE_ENCRYPTED);
    fr.expect(WIRE_PART, "part_ in footer");
    u32 footer_index = fr.number("footer index");
    fr.expect(WIRE_CLOSE, "-- after footer");
    if (fr.pos() != footer.size()) throw FormatError("Malformed record: trailing data after footer");

    if (footer_enc != rec.encrypted()) {
        throw FormatError("Malformed record: header and footer disagree on ENCRYPTED marker");
    }
    if (footer_index != rec.index) {
        throw FormatError("Header/footer index mismatch: " + std::to_string(rec.index) +
                          " vs " + std::to_string(footer_index));
    }

    std::string payload = body_and_footer.substr(0, end);
    if (rec.encrypted()) {
        std::string compact;
        compact.reserve(payload.size());
        for (char c : payload) {
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
            if (!is_base64_char(c)) throw FormatError("Encrypted payload is not base64");
            compact.push_back(c);
        }
        if (compact.empty()) throw FormatError("Encrypted payload is empty");
        rec.payload = std::move(compact);
    } else {
        rec.payload = std::move(payload);
    }
    return rec;
}

std::string codec::open_payload(const WireRecord& rec, const Encryption* enc) {
    if (!rec.encrypted()) return rec.payload;
    if (!enc) throw DecryptionError("Record " + std::to_string(rec.index) + " is encrypted: password required");
    crypto::EncryptedBlob blob = crypto::CryptoEngine::decode_from_transport(rec.payload);
    return enc->engine.decrypt(blob, enc->password);
}

std::string codec::chunk_file_name(const std::string& filename, u32 index, u32 total,
                                   bool encrypted, const std::string& ext) {
    std::string stem = fs::path(filename).stem().string();
    if (stem.empty()) stem = "chunk";
    std::string out = stem;
    if (encrypted) out += "_encrypted";
    out += "_part_" + utils::pad_number(index) + "_of_" + utils::pad_number(total) + ext;
    return out;
}
