// ============================================================
// receiver_app.cpp -- qrcp receiver: chunk files / scans -> files
// ============================================================

#include "receiver_app.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

ReceiverApp::ReceiverApp(ReceiverOptions opts, const crypto::CryptoEngine* engine,
                         SymbolCodec* symbols)
    : opts_(std::move(opts))
    , engine_(engine)
    , collector_(symbols)
{}

void ReceiverApp::collect() {
    for (auto& in : opts_.inputs) {
        std::error_code ec;
        if (fs::is_directory(in, ec)) {
            collector_.add_directory(in);
            continue;
        }
        if (!fs::is_regular_file(in, ec)) {
            throw InputError("Input not found: " + in);
        }
        std::string ext = fs::path(in).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        const auto& img = ChunkCollector::image_extensions();
        if (std::find(img.begin(), img.end(), ext) != img.end()) {
            collector_.add_image_file(in);
        } else {
            collector_.add_file(in);
        }
    }

    const CollectorStats& st = collector_.stats();
    if (st.format_errors) {
        LOG_WARN(std::to_string(st.format_errors) + " unusable record(s) skipped");
    }
    if (st.duplicates) {
        LOG_INFO(std::to_string(st.duplicates) + " duplicate record(s) dropped");
    }
}

BatchReport ReceiverApp::run() {
    if (opts_.inputs.empty()) throw InputError("No input given");
    opts_.config.validate();

    collect();

    if (!opts_.save_chunks_dir.empty()) {
        collector_.save_chunks_as_text(opts_.save_chunks_dir);
    }
    if (!opts_.report_path.empty()) {
        collector_.write_report(opts_.report_path);
    }

    ReassemblyOptions ro;
    ro.output_dir        = opts_.config.output_dir;
    ro.suffix            = opts_.suffix;
    ro.verify_only       = opts_.verify_only;
    ro.overwrite         = opts_.overwrite;
    ro.confirm_overwrite = confirm_overwrite_;

    if (collector_.any_encrypted() && !engine_) {
        LOG_WARN("Encrypted records found but decryption is not available");
    }

    Reassembler reassembler(engine_, ro, provider_);
    BatchReport report = reassembler.run(collector_);
    print_summary(report);
    return report;
}

void ReceiverApp::print_summary(const BatchReport& report) const {
    for (auto& f : report.files) {
        if (f.ok()) continue;
        std::string line = f.filename + ": " + reassembly_status_str(f.status);
        if (!f.missing.empty()) line += ", missing parts " + utils::format_index_list(f.missing);
        LOG_ERROR(line);
    }
    if (!report.files.empty() && report.failed()) {
        LOG_ERROR(std::to_string(report.failed()) + " of " + std::to_string(report.files.size()) +
                  " file(s) failed");
    }
}
