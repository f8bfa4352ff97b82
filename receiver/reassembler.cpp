// ============================================================
// reassembler.cpp -- Verified reconstruction of collected files
// ============================================================

#include "reassembler.hpp"
#include "chunk_collector.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

const char* reassembly_status_str(ReassemblyStatus s) {
    switch (s) {
        case ReassemblyStatus::VERIFIED:              return "verified";
        case ReassemblyStatus::MISSING_PARTS:         return "missing parts";
        case ReassemblyStatus::INCONSISTENT_METADATA: return "inconsistent metadata";
        case ReassemblyStatus::CHUNK_INTEGRITY:       return "chunk integrity";
        case ReassemblyStatus::FILE_INTEGRITY:        return "file integrity";
        case ReassemblyStatus::DECRYPTION_FAILED:     return "decryption failed";
        case ReassemblyStatus::FORMAT:                return "format";
        case ReassemblyStatus::UNSAFE_NAME:           return "unsafe name";
        case ReassemblyStatus::OUTPUT_EXISTS:         return "output exists";
        case ReassemblyStatus::WRITE_FAILED:          return "write failed";
    }
    return "?";
}

size_t BatchReport::succeeded() const {
    size_t n = 0;
    for (auto& f : files) if (f.ok()) ++n;
    return n;
}

Reassembler::Reassembler(const crypto::CryptoEngine* engine, ReassemblyOptions opts,
                         PasswordProvider provider)
    : engine_(engine)
    , opts_(std::move(opts))
    , provider_(std::move(provider))
{
    if (opts_.max_password_attempts < 1) opts_.max_password_attempts = 1;
}

void Reassembler::forget_password() {
    password_.clear();
    rejected_.clear();
}

std::string Reassembler::output_path_for(const std::string& filename) const {
    std::string name = filename;
    if (!opts_.suffix.empty()) {
        fs::path p(filename);
        std::string ext = p.extension().string();
        std::string base = filename.substr(0, filename.size() - ext.size());
        name = base + opts_.suffix + ext;
    }
    return file_io::safe_join(fs::path(opts_.output_dir), name).string();
}

// ============================================================
// Password handling
// ============================================================

bool Reassembler::obtain_password() {
    if (!password_.empty()) return true;
    if (exhausted_ || !provider_) return false;
    if (attempts_ >= opts_.max_password_attempts) {
        exhausted_ = true;
        return false;
    }
    ++attempts_;
    crypto::Password pw;
    if (!provider_(pw, attempts_) || pw.empty()) {
        exhausted_ = true;
        return false;
    }
    password_ = std::move(pw);
    return true;
}

std::string Reassembler::open_first_encrypted(const WireRecord& rec) {
    for (;;) {
        if (!obtain_password()) {
            throw DecryptionError(attempts_ ? "Password attempts exhausted" : "No password available");
        }
        // FormatError passes through: a damaged payload says nothing about the password
        codec::Encryption enc{*engine_, password_};
        try {
            std::string body = codec::open_payload(rec, &enc);
            password_confirmed_ = true;
            rejected_.clear();
            return body;
        } catch (const DecryptionError& e) {
            Logger::get().integrity_error(rec.filename + " part " + std::to_string(rec.index) +
                                          ": " + e.what());
            if (password_insisted_) throw;
            if (!rejected_.empty() && crypto::same_password(rejected_, password_)) {
                // Same password twice: keep it and blame the record
                password_insisted_ = true;
                rejected_.clear();
                throw DecryptionError(std::string(e.what()) +
                                      " (same password entered again, record treated as corrupted)");
            }
            rejected_ = std::move(password_);
            if (attempts_ >= opts_.max_password_attempts) {
                exhausted_ = true;
                throw;
            }
            LOG_WARN("Wrong password or corrupted data, asking again (attempt " +
                     std::to_string(attempts_ + 1) + " of " +
                     std::to_string(opts_.max_password_attempts) + ")");
        }
    }
}

std::string Reassembler::open_record(const WireRecord& rec) {
    if (!rec.encrypted()) return rec.payload;
    if (!engine_) throw DecryptionError("Encrypted record but no crypto engine is available");
    if (exhausted_) throw DecryptionError("Password attempts exhausted");
    if (!password_confirmed_) return open_first_encrypted(rec);

    codec::Encryption enc{*engine_, password_};
    try {
        return codec::open_payload(rec, &enc);
    } catch (const DecryptionError& e) {
        Logger::get().integrity_error(rec.filename + " part " + std::to_string(rec.index) +
                                      ": " + e.what());
        throw;
    }
}

// ============================================================
// Verification
// ============================================================

std::string Reassembler::verify(const ReconstructionSet& set) {
    set.check_consistency();
    std::vector<const WireRecord*> ordered = set.ordered();

    std::vector<u32> extra = set.extra_parts();
    if (!extra.empty()) {
        LOG_WARN(set.filename() + ": ignoring extra parts " + utils::format_index_list(extra));
    }

    std::string content;
    hash::Sha256Stream file_hasher;
    for (const WireRecord* rec : ordered) {
        std::string body = open_record(*rec);
        std::string actual = hash::chunk_hash(body);
        if (actual != rec->chunk_hash) {
            throw ChunkIntegrityError(rec->index, rec->chunk_hash, actual);
        }
        file_hasher.update(body);
        content += body;
    }

    const std::string& expected = ordered.front()->file_hash;
    std::string actual = file_hasher.hex_digest();
    if (actual != expected) {
        throw FileIntegrityError(expected, actual);
    }
    return content;
}

FileResult Reassembler::reassemble(ReconstructionSet& set) {
    FileResult r;
    r.filename  = set.filename();
    r.encrypted = set.any_encrypted();

    auto fail = [&](ReassemblyStatus st, const std::string& msg) {
        r.status  = st;
        r.message = msg;
        set.mark_failed();
        LOG_ERROR(r.filename + ": " + msg);
    };

    std::string out_path;
    if (!opts_.verify_only) {
        try {
            out_path = output_path_for(set.filename());
        } catch (const std::exception& e) {
            fail(ReassemblyStatus::UNSAFE_NAME, e.what());
            return r;
        }
    }

    std::string content;
    try {
        content = verify(set);
    } catch (const MissingPartsError& e) {
        r.missing = e.missing();
        fail(ReassemblyStatus::MISSING_PARTS, e.what());
        return r;
    } catch (const InconsistentMetadataError& e) {
        fail(ReassemblyStatus::INCONSISTENT_METADATA, e.what());
        return r;
    } catch (const ChunkIntegrityError& e) {
        Logger::get().integrity_error(r.filename + ": " + e.what());
        fail(ReassemblyStatus::CHUNK_INTEGRITY, e.what());
        return r;
    } catch (const FileIntegrityError& e) {
        Logger::get().integrity_error(r.filename + ": " + e.what());
        fail(ReassemblyStatus::FILE_INTEGRITY, e.what());
        return r;
    } catch (const DecryptionError& e) {
        fail(ReassemblyStatus::DECRYPTION_FAILED, e.what());
        return r;
    } catch (const FormatError& e) {
        fail(ReassemblyStatus::FORMAT, e.what());
        return r;
    }
    r.bytes = content.size();

    if (opts_.verify_only) {
        r.message = "verified, " + utils::format_bytes(r.bytes) + " (not written)";
        set.mark_verified();
        LOG_INFO(r.filename + ": " + r.message);
        return r;
    }

    std::error_code ec;
    if (fs::exists(out_path, ec) && !opts_.overwrite) {
        bool allowed = opts_.confirm_overwrite && opts_.confirm_overwrite(out_path);
        if (!allowed) {
            fail(ReassemblyStatus::OUTPUT_EXISTS, "output exists, not overwritten: " + out_path);
            return r;
        }
    }

    try {
        file_io::write_file_atomic(out_path, content);
    } catch (const std::exception& e) {
        fail(ReassemblyStatus::WRITE_FAILED, e.what());
        return r;
    }

    r.output_path = out_path;
    r.message = "written " + utils::format_bytes(r.bytes);
    set.mark_verified();
    LOG_INFO(r.filename + ": verified and written to " + out_path +
             (r.encrypted ? " (decrypted)" : ""));
    return r;
}

BatchReport Reassembler::run(ChunkCollector& collector) {
    BatchReport report;
    for (auto& [name, set] : collector.sets()) {
        report.files.push_back(reassemble(set));
    }
    forget_password();

    if (report.files.empty()) {
        LOG_WARN("No chunk records found");
    } else {
        LOG_INFO("Rebuilt " + std::to_string(report.succeeded()) + " of " +
                 std::to_string(report.files.size()) + " file(s)");
    }
    return report;
}
