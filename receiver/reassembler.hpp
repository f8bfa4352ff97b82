#pragma once

// ============================================================
// reassembler.hpp -- Verified reconstruction of collected files
//
// Per file: consistency -> completeness -> decrypt -> chunk hashes ->
// file hash -> temp write -> rename. A failure stops that file only;
// the batch carries on with the next filename.
//
// The password is asked for once per run. If the first decryption of
// the run fails it is discarded and asked for again, up to
// max_password_attempts; after that encrypted files fail without
// further decryption. Re-entering the password that just failed marks
// the record as corrupted instead: that file fails and the password is
// kept for the next one. Structurally broken payloads fail with a
// FormatError and cost no attempt.
// ============================================================

#include "../common/platform.hpp"
#include "../common/crypto.hpp"
#include "reconstruction_set.hpp"
#include <functional>
#include <string>
#include <vector>

class ChunkCollector;

enum class ReassemblyStatus {
    VERIFIED,
    MISSING_PARTS,
    INCONSISTENT_METADATA,
    CHUNK_INTEGRITY,
    FILE_INTEGRITY,
    DECRYPTION_FAILED,
    FORMAT,
    UNSAFE_NAME,
    OUTPUT_EXISTS,
    WRITE_FAILED,
};

const char* reassembly_status_str(ReassemblyStatus s);

struct FileResult {
    std::string      filename;
    ReassemblyStatus status{ReassemblyStatus::VERIFIED};
    std::string      message;
    std::vector<u32> missing;        // for MISSING_PARTS, sorted
    std::string      output_path;    // empty unless written
    u64              bytes{0};
    bool             encrypted{false};

    bool ok() const { return status == ReassemblyStatus::VERIFIED; }
};

struct BatchReport {
    std::vector<FileResult> files;

    size_t succeeded() const;
    size_t failed() const { return files.size() - succeeded(); }
    bool ok() const { return !files.empty() && failed() == 0; }
};

struct ReassemblyOptions {
    std::string output_dir{"."};
    std::string suffix;                 // inserted before the extension
    bool        verify_only{false};     // hash checks only, no output file
    bool        overwrite{false};
    // Asked when the destination exists and overwrite is false
    std::function<bool(const std::string& path)> confirm_overwrite;
    int         max_password_attempts{3};
};

// Fill `out` for the given attempt (1-based); return false to give up
using PasswordProvider = std::function<bool(crypto::Password& out, int attempt)>;

class Reassembler {
public:
    // engine may be nullptr; encrypted files then fail with DECRYPTION_FAILED
    Reassembler(const crypto::CryptoEngine* engine, ReassemblyOptions opts,
                PasswordProvider provider = nullptr);

    BatchReport run(ChunkCollector& collector);

    // Verify and (unless verify_only) write one file; never throws for
    // per-file failures.
    FileResult reassemble(ReconstructionSet& set);

    // Full check chain; returns the reconstructed text.
    // Throws the typed error of the first check that fails.
    std::string verify(const ReconstructionSet& set);

    // Destination for a record filename (suffix applied); throws on unsafe names
    std::string output_path_for(const std::string& filename) const;

    // Drop the password held for this run
    void forget_password();

private:
    std::string open_record(const WireRecord& rec);
    std::string open_first_encrypted(const WireRecord& rec);
    bool obtain_password();

    const crypto::CryptoEngine* engine_;
    ReassemblyOptions           opts_;
    PasswordProvider            provider_;
    crypto::Password            password_;
    crypto::Password            rejected_;
    int                         attempts_{0};
    bool                        password_confirmed_{false};
    bool                        password_insisted_{false};
    bool                        exhausted_{false};
};
