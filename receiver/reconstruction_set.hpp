#pragma once

// ============================================================
// reconstruction_set.hpp -- Records collected for one filename
//
// Lifecycle: COLLECTING -> COMPLETE -> { VERIFIED | FAILED }
// Indices outside 1..total are kept apart as extra parts and never
// take part in reconstruction.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <map>
#include <string>
#include <vector>

enum class SetState {
    COLLECTING,
    COMPLETE,
    VERIFIED,
    FAILED,
};

const char* set_state_str(SetState s);

class ReconstructionSet {
public:
    explicit ReconstructionSet(const std::string& filename) : filename_(filename) {}

    // Last write wins on a repeated index (logged). Returns false if the
    // record replaced an existing one.
    bool insert(WireRecord rec);

    const std::string& filename() const { return filename_; }

    // Total declared by the first record seen
    u32 declared_total() const { return declared_total_; }

    // Sorted indices in 1..total with no record
    std::vector<u32> missing_parts() const;

    // Sorted indices beyond the declared total
    std::vector<u32> extra_parts() const;

    size_t record_count() const { return records_.size(); }
    size_t duplicates() const { return duplicates_; }

    bool is_complete() const;
    bool any_encrypted() const;

    // Throws InconsistentMetadataError if the records disagree on total,
    // file_hash or encryption. Reports every conflicting value.
    void check_consistency() const;

    // Records 1..total in index order; throws MissingPartsError if incomplete
    std::vector<const WireRecord*> ordered() const;

    // Every record held, including extras, in index order
    const std::map<u32, WireRecord>& records() const { return records_; }

    u64 payload_bytes() const;

    SetState state() const;
    void mark_verified() { final_state_ = SetState::VERIFIED; }
    void mark_failed() { final_state_ = SetState::FAILED; }

private:
    std::string               filename_;
    std::map<u32, WireRecord> records_;
    u32                       declared_total_{0};
    size_t                    duplicates_{0};
    SetState                  final_state_{SetState::COLLECTING};
};
