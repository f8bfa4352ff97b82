// ============================================================
// sender_app.cpp -- qrcp sender: file -> chunk files (+ symbols)
// ============================================================

#include "sender_app.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/chunker.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <random>
#include <sstream>
#include <iomanip>

namespace fs = std::filesystem;

SenderApp::SenderApp(SenderOptions opts, const crypto::CryptoEngine* engine, SymbolCodec* symbols)
    : opts_(std::move(opts))
    , engine_(engine)
    , symbols_(symbols)
{}

void SenderApp::stop() {
    stopped_.store(true);
    ChunkEncoder* enc = encoder_.load();
    if (enc) enc->cancel();
}

// ============================================================
// StopOnSignal
// ============================================================

namespace {

std::atomic<SenderApp*> g_signal_app{nullptr};

void stop_handler(int /*sig*/) {
    SenderApp* app = g_signal_app.load();
    if (app) app->stop();
}

} // namespace

StopOnSignal::StopOnSignal(SenderApp& app) {
    g_signal_app.store(&app);
    std::signal(SIGINT,  stop_handler);
    std::signal(SIGTERM, stop_handler);
}

StopOnSignal::~StopOnSignal() {
    std::signal(SIGINT,  SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_app.store(nullptr);
}

SenderApp* StopOnSignal::active() {
    return g_signal_app.load();
}

void SenderApp::validate_request() const {
    if (!utils::validate_path(opts_.input_path)) {
        throw InputError("Invalid input path");
    }
    std::error_code ec;
    if (!fs::exists(opts_.input_path, ec)) {
        throw InputError("File not found: " + opts_.input_path);
    }
    if (!fs::is_regular_file(opts_.input_path, ec)) {
        throw InputError("Not a regular file: " + opts_.input_path);
    }
    codec::validate_filename(fs::path(opts_.input_path).filename().string());
    opts_.config.validate();

    if (opts_.encrypt) {
        if (!engine_) {
            throw InputError("Encryption requested but no crypto engine is available");
        }
        if (password_.empty()) {
            throw InputError("Encryption requested but no password was supplied");
        }
        crypto::validate_new_password(password_);
    }
}

std::vector<Chunk> SenderApp::read_chunks(const std::string& filename, std::string& file_hash) {
    const size_t cap = opts_.config.chunk_cap(opts_.encrypt);

    file_io::TextLineReader reader(opts_.input_path);
    hash::Sha256Stream hasher;
    std::vector<std::string> bodies;

    chunker::split_stream(reader, cap,
        [&bodies](std::string&& b) { bodies.push_back(std::move(b)); },
        [&hasher](const std::string& line) { hasher.update(line); });

    file_hash = hasher.hex_digest();

    if (reader.had_bom()) LOG_DEBUG("Stripped UTF-8 BOM from " + filename);
    if (reader.had_invalid_utf8()) {
        LOG_WARN(filename + ": invalid UTF-8 replaced with U+FFFD");
    }
    // An empty file still travels as one (empty) chunk
    if (bodies.empty()) bodies.emplace_back();

    std::vector<Chunk> chunks;
    chunks.reserve(bodies.size());
    u32 total = (u32)bodies.size();
    for (u32 i = 0; i < total; ++i) {
        Chunk c;
        c.index     = i + 1;
        c.total     = total;
        c.filename  = filename;
        c.body      = std::move(bodies[i]);
        c.file_hash = file_hash;
        chunks.push_back(std::move(c));
    }

    LOG_INFO("Read " + filename + ": " + utils::format_bytes(reader.bytes_read()) + ", " +
             std::to_string(reader.lines_read()) + " lines, " + std::to_string(total) +
             " chunks (cap " + std::to_string(cap) + " bytes)");
    return chunks;
}

bool SenderApp::confirm_capacity(u32 total) {
    const u32 threshold = opts_.config.capacity_warning;
    if (total <= threshold) return true;

    LOG_WARN(std::to_string(total) + " chunks exceeds the capacity warning threshold of " +
             std::to_string(threshold));
    if (opts_.force) return true;
    if (!confirm_) {
        LOG_WARN("No confirmation available; use --force to proceed");
        return false;
    }
    return confirm_(total, threshold);
}

static std::string staging_name() {
    std::random_device rd;
    std::ostringstream ss;
    ss << ".qrcp-staging-" << std::hex << std::setw(8) << std::setfill('0') << rd();
    return ss.str();
}

void SenderApp::publish(const std::vector<WireRecord>& records, SendResult& res) {
    const fs::path out_dir(opts_.config.output_dir);
    fs::create_directories(out_dir);
    const fs::path staging = out_dir / staging_name();
    fs::create_directories(staging);

    std::vector<std::pair<fs::path, fs::path>> moves;
    std::vector<fs::path> published;
    try {
        SymbolOptions sym_opts = opts_.config.symbol_options();
        for (const auto& rec : records) {
            if (stopped_.load()) throw std::runtime_error("Interrupted");

            std::string name = codec::chunk_file_name(rec.filename, rec.index, rec.total,
                                                      rec.encrypted());
            std::string wire = codec::render(rec);
            file_io::write_file_atomic((staging / name).string(), wire);
            moves.emplace_back(staging / name, out_dir / name);

            if (symbols_) {
                std::string img_name = codec::chunk_file_name(rec.filename, rec.index, rec.total,
                                                              rec.encrypted(),
                                                              symbols_->image_extension());
                std::vector<u8> img = symbols_->encode_symbol(wire, sym_opts);
                file_io::write_file_atomic((staging / img_name).string(),
                                           std::string(img.begin(), img.end()));
                moves.emplace_back(staging / img_name, out_dir / img_name);
            }
        }
        if (stopped_.load()) throw std::runtime_error("Interrupted");

        for (auto& mv : moves) {
            fs::rename(mv.first, mv.second);
            published.push_back(mv.second);
            const std::string ext = mv.second.extension().string();
            if (ext == ".txt") res.chunk_files.push_back(mv.second.string());
            else               res.image_files.push_back(mv.second.string());
        }
    } catch (const std::exception& e) {
        std::error_code ec;
        // Take back what already reached the output directory
        for (auto& p : published) {
            fs::remove(p, ec);
            if (ec) LOG_WARN("Could not remove partial output " + p.string() + ": " + ec.message());
        }
        res.chunk_files.clear();
        res.image_files.clear();
        fs::remove_all(staging, ec);
        throw std::runtime_error(std::string("Writing chunk files failed: ") + e.what());
    }

    std::error_code ec;
    fs::remove_all(staging, ec);
    if (ec) LOG_WARN("Could not remove staging directory " + staging.string() + ": " + ec.message());
}

SendResult SenderApp::run() {
    SendResult res;
    validate_request();

    auto t0 = std::chrono::steady_clock::now();
    res.filename = fs::path(opts_.input_path).filename().string();

    std::vector<Chunk> chunks = read_chunks(res.filename, res.file_hash);
    res.total = (u32)chunks.size();

    if (!confirm_capacity(res.total)) {
        LOG_INFO("Cancelled: " + std::to_string(res.total) + " chunks not confirmed");
        res.declined = true;
        password_.clear();
        return res;
    }

    ChunkEncoder encoder(opts_.config.max_workers, opts_.config.parallel_threshold,
                         opts_.parallel);
    encoder_.store(&encoder);
    if (stopped_.load()) encoder.cancel();

    EncodeReport rep;
    if (opts_.encrypt) {
        codec::Encryption enc{*engine_, password_};
        rep = encoder.encode_all(chunks, [&enc](const Chunk& c) {
            return codec::make_record(c, &enc);
        });
    } else {
        rep = encoder.encode_all(chunks, [](const Chunk& c) {
            return codec::make_record(c, nullptr);
        });
    }
    encoder_.store(nullptr);
    password_.clear();

    if (rep.cancelled || stopped_.load()) {
        LOG_WARN("Interrupted: no chunk files written");
        res.cancelled = true;
        return res;
    }
    if (!rep.ok()) {
        res.failed_indices = rep.failed_indices();
        LOG_ERROR("Failed chunk indices: " + utils::format_index_list(res.failed_indices) +
                  "; no chunk files written");
        return res;
    }

    try {
        publish(rep.records, res);
    } catch (const std::exception&) {
        if (stopped_.load()) {
            LOG_WARN("Interrupted: no chunk files written");
            res.cancelled = true;
            return res;
        }
        throw;
    }

    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << secs;
    LOG_INFO("Wrote " + std::to_string(res.chunk_files.size()) + " chunk files" +
             (opts_.encrypt ? " (encrypted)" : "") + " to " + opts_.config.output_dir +
             " in " + ss.str() + "s");
    LOG_INFO("File hash: " + res.file_hash);
    res.ok = true;
    return res;
}
