#pragma once

// ============================================================
// chunk_collector.hpp -- Gathers wire records from any source
//
// Sources: chunk text files, raw strings, scanned images (through a
// SymbolCodec). Records are grouped per filename into
// ReconstructionSets. A record that fails to parse is counted and
// skipped; a byte-identical payload seen twice is dropped.
// ============================================================

#include "../common/platform.hpp"
#include "../common/hash.hpp"
#include "../common/symbol_codec.hpp"
#include "reconstruction_set.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

struct CollectorStats {
    u64 sources{0};          // files, images and raw strings offered
    u64 records{0};          // records accepted
    u64 format_errors{0};
    u64 duplicates{0};       // identical payloads dropped
    u64 images{0};
    u64 symbols_found{0};    // payloads recovered from images
};

class ChunkCollector {
public:
    explicit ChunkCollector(SymbolCodec* symbols = nullptr) : symbols_(symbols) {}

    // Returns true if the text was a new, well-formed record
    bool add_text(const std::string& text, const std::string& source = "<input>");

    // One chunk file; returns records accepted (0 or 1)
    size_t add_file(const std::string& path);

    // Every *.txt in dir (sorted) plus images when a SymbolCodec is set
    size_t add_directory(const std::string& dir);

    // Payloads decoded from one image; requires a SymbolCodec
    size_t add_image(const std::vector<u8>& image, const std::string& source = "<image>");
    size_t add_image_file(const std::string& path);

    std::map<std::string, ReconstructionSet>&       sets()       { return sets_; }
    const std::map<std::string, ReconstructionSet>& sets() const { return sets_; }

    bool any_encrypted() const;
    const CollectorStats& stats() const { return stats_; }

    // Write every accepted record back to {dir}/{chunk file name}; returns paths
    std::vector<std::string> save_chunks_as_text(const std::string& dir) const;

    // Plain-text summary of what was collected
    std::string report() const;
    void write_report(const std::string& path) const;

    static const std::vector<std::string>& image_extensions();

private:
    SymbolCodec*                             symbols_;
    std::map<std::string, ReconstructionSet> sets_;
    std::set<hash::Hash128>                  seen_;
    CollectorStats                           stats_;
};
