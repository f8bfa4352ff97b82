// ============================================================
// reconstruction_set.cpp -- Records collected for one filename
// ============================================================

#include "reconstruction_set.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <set>

const char* set_state_str(SetState s) {
    switch (s) {
        case SetState::COLLECTING: return "collecting";
        case SetState::COMPLETE:   return "complete";
        case SetState::VERIFIED:   return "verified";
        case SetState::FAILED:     return "failed";
    }
    return "?";
}

bool ReconstructionSet::insert(WireRecord rec) {
    if (records_.empty()) declared_total_ = rec.total;

    const u32 index = rec.index;
    auto it = records_.find(index);
    if (it != records_.end()) {
        ++duplicates_;
        LOG_WARN(filename_ + ": part " + std::to_string(index) +
                 " received again, replacing the earlier copy");
        it->second = std::move(rec);
        return false;
    }
    if (declared_total_ && index > declared_total_) {
        LOG_WARN(filename_ + ": extra part " + std::to_string(index) +
                 " beyond declared total " + std::to_string(declared_total_) + " ignored");
    }
    records_.emplace(index, std::move(rec));
    return true;
}

std::vector<u32> ReconstructionSet::missing_parts() const {
    std::vector<u32> missing;
    for (u32 i = 1; i <= declared_total_; ++i) {
        if (records_.find(i) == records_.end()) missing.push_back(i);
    }
    return missing;
}

std::vector<u32> ReconstructionSet::extra_parts() const {
    std::vector<u32> extra;
    for (auto it = records_.upper_bound(declared_total_); it != records_.end(); ++it) {
        extra.push_back(it->first);
    }
    return extra;
}

bool ReconstructionSet::is_complete() const {
    return declared_total_ > 0 && missing_parts().empty();
}

bool ReconstructionSet::any_encrypted() const {
    for (auto& [idx, rec] : records_) {
        if (rec.encrypted()) return true;
    }
    return false;
}

void ReconstructionSet::check_consistency() const {
    std::set<u32>         totals;
    std::set<std::string> file_hashes;
    std::set<RecordKind>  kinds;
    for (auto& [idx, rec] : records_) {
        totals.insert(rec.total);
        file_hashes.insert(rec.file_hash);
        kinds.insert(rec.kind);
    }

    std::string problems;
    if (totals.size() > 1) {
        problems += "total disagrees (";
        bool first = true;
        for (u32 t : totals) {
            if (!first) problems += ", ";
            problems += std::to_string(t);
            first = false;
        }
        problems += ")";
    }
    if (file_hashes.size() > 1) {
        if (!problems.empty()) problems += "; ";
        problems += "file_hash disagrees (";
        bool first = true;
        for (auto& h : file_hashes) {
            if (!first) problems += ", ";
            problems += h;
            first = false;
        }
        problems += ")";
    }
    if (kinds.size() > 1) {
        if (!problems.empty()) problems += "; ";
        problems += "mixed encrypted and plain records";
    }
    if (!problems.empty()) {
        throw InconsistentMetadataError(filename_ + ": " + problems);
    }
}

std::vector<const WireRecord*> ReconstructionSet::ordered() const {
    std::vector<u32> missing = missing_parts();
    if (declared_total_ == 0 || !missing.empty()) {
        throw MissingPartsError(filename_ + ": missing parts " + utils::format_index_list(missing),
                                missing);
    }
    std::vector<const WireRecord*> out;
    out.reserve(declared_total_);
    for (u32 i = 1; i <= declared_total_; ++i) {
        out.push_back(&records_.at(i));
    }
    return out;
}

u64 ReconstructionSet::payload_bytes() const {
    u64 n = 0;
    for (auto& [idx, rec] : records_) n += rec.payload.size();
    return n;
}

SetState ReconstructionSet::state() const {
    if (final_state_ != SetState::COLLECTING) return final_state_;
    return is_complete() ? SetState::COMPLETE : SetState::COLLECTING;
}
