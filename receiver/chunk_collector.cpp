// ============================================================
// chunk_collector.cpp -- Gathers wire records from any source
// ============================================================

#include "chunk_collector.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

const std::vector<std::string>& ChunkCollector::image_extensions() {
    static const std::vector<std::string> exts = {".png", ".jpg", ".jpeg", ".bmp"};
    return exts;
}

bool ChunkCollector::add_text(const std::string& text, const std::string& source) {
    ++stats_.sources;

    hash::Hash128 fp = hash::xxh3_128(text);
    if (seen_.count(fp)) {
        ++stats_.duplicates;
        LOG_WARN(source + ": identical record already collected, skipped");
        return false;
    }

    WireRecord rec;
    try {
        rec = codec::decode(text);
    } catch (const FormatError& e) {
        ++stats_.format_errors;
        LOG_WARN(source + ": unusable record: " + e.what());
        return false;
    }
    seen_.insert(fp);

    LOG_DEBUG(source + ": " + rec.filename + " part " + std::to_string(rec.index) + "/" +
              std::to_string(rec.total) + " (" + record_kind_str(rec.kind) + ")");

    auto it = sets_.find(rec.filename);
    if (it == sets_.end()) {
        it = sets_.emplace(rec.filename, ReconstructionSet(rec.filename)).first;
    }
    it->second.insert(std::move(rec));
    ++stats_.records;
    return true;
}

size_t ChunkCollector::add_file(const std::string& path) {
    std::string text;
    try {
        text = file_io::read_raw_file(path);
    } catch (const std::exception& e) {
        ++stats_.sources;
        ++stats_.format_errors;
        LOG_WARN(std::string("Cannot read chunk file: ") + e.what());
        return 0;
    }
    return add_text(text, fs::path(path).filename().string()) ? 1 : 0;
}

size_t ChunkCollector::add_image(const std::vector<u8>& image, const std::string& source) {
    if (!symbols_) {
        throw InputError("Image input requires a symbol decoder");
    }
    ++stats_.images;
    std::vector<std::string> payloads;
    try {
        payloads = symbols_->decode_symbols(image);
    } catch (const std::exception& e) {
        LOG_WARN(source + ": symbol decoding failed: " + e.what());
        return 0;
    }
    if (payloads.empty()) {
        LOG_WARN(source + ": no symbols found");
        return 0;
    }

    stats_.symbols_found += payloads.size();
    size_t accepted = 0;
    for (size_t i = 0; i < payloads.size(); ++i) {
        if (add_text(payloads[i], source + "#" + std::to_string(i + 1))) ++accepted;
    }
    return accepted;
}

size_t ChunkCollector::add_image_file(const std::string& path) {
    std::string raw = file_io::read_raw_file(path);
    return add_image(std::vector<u8>(raw.begin(), raw.end()), fs::path(path).filename().string());
}

size_t ChunkCollector::add_directory(const std::string& dir) {
    size_t accepted = 0;
    for (auto& path : file_io::list_files(dir, {".txt"})) {
        accepted += add_file(path);
    }
    if (symbols_) {
        for (auto& path : file_io::list_files(dir, image_extensions())) {
            accepted += add_image_file(path);
        }
    }
    LOG_INFO("Collected " + std::to_string(accepted) + " records for " +
             std::to_string(sets_.size()) + " file(s) from " + dir);
    return accepted;
}

bool ChunkCollector::any_encrypted() const {
    for (auto& [name, set] : sets_) {
        if (set.any_encrypted()) return true;
    }
    return false;
}

std::vector<std::string> ChunkCollector::save_chunks_as_text(const std::string& dir) const {
    std::vector<std::string> written;
    fs::create_directories(dir);
    for (auto& [name, set] : sets_) {
        for (auto& [idx, rec] : set.records()) {
            std::string file = codec::chunk_file_name(rec.filename, rec.index, rec.total,
                                                      rec.encrypted());
            std::string path = (fs::path(dir) / file).string();
            file_io::write_file_atomic(path, codec::render(rec));
            written.push_back(path);
        }
    }
    LOG_INFO("Saved " + std::to_string(written.size()) + " chunk files to " + dir);
    return written;
}

std::string ChunkCollector::report() const {
    std::ostringstream ss;
    ss << "qrcp scan report\n";
    ss << "sources: "            << stats_.sources       << "\n";
    ss << "images: "             << stats_.images        << "\n";
    ss << "symbols found: "      << stats_.symbols_found << "\n";
    ss << "records: "            << stats_.records       << "\n";
    ss << "format errors: "      << stats_.format_errors << "\n";
    ss << "duplicates dropped: " << stats_.duplicates    << "\n";

    for (auto& [name, set] : sets_) {
        std::vector<u32> present;
        for (auto& [idx, rec] : set.records()) present.push_back(idx);

        ss << "\nfile: " << name << "\n";
        ss << "  total: "      << set.declared_total() << "\n";
        ss << "  state: "      << set_state_str(set.state()) << "\n";
        ss << "  encrypted: "  << (set.any_encrypted() ? "yes" : "no") << "\n";
        ss << "  present: "    << utils::format_index_list(present) << "\n";
        ss << "  missing: "    << utils::format_index_list(set.missing_parts()) << "\n";
        std::vector<u32> extra = set.extra_parts();
        if (!extra.empty()) ss << "  extra: " << utils::format_index_list(extra) << "\n";
        ss << "  body bytes: " << set.payload_bytes() << "\n";
    }
    return ss.str();
}

void ChunkCollector::write_report(const std::string& path) const {
    file_io::write_file_atomic(path, report());
    LOG_INFO("Scan report written to " + path);
}
