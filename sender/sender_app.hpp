#pragma once

// ============================================================
// sender_app.hpp -- qrcp sender: file -> chunk files (+ symbols)
//
// Pipeline:
//   TextLineReader ─┬─> Sha256Stream            (file_hash)
//                   └─> LineChunker             (bodies)
//   bodies -> ChunkEncoder(make_record) -> staging dir -> output dir
//
// Nothing reaches the output directory unless every chunk encoded.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/protocol.hpp"
#include "../common/symbol_codec.hpp"
#include "chunk_encoder.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

struct SenderOptions {
    std::string input_path;
    Config      config;
    bool        encrypt{false};
    bool        force{false};      // skip the capacity confirmation
    bool        parallel{true};
};

struct SendResult {
    bool                     ok{false};
    bool                     declined{false};   // capacity confirmation refused
    bool                     cancelled{false};
    std::string              filename;
    std::string              file_hash;
    u32                      total{0};
    std::vector<std::string> chunk_files;        // final paths, index order
    std::vector<std::string> image_files;
    std::vector<u32>         failed_indices;
};

class SenderApp {
public:
    // (chunk_count, threshold) -> proceed?
    using ConfirmFn = std::function<bool(u32, u32)>;

    // engine is required only for encrypted runs; symbols may be nullptr
    explicit SenderApp(SenderOptions opts,
                       const crypto::CryptoEngine* engine = nullptr,
                       SymbolCodec* symbols = nullptr);

    void set_password(crypto::Password pw) { password_ = std::move(pw); }
    void set_confirm(ConfirmFn fn) { confirm_ = std::move(fn); }

    // Throws InputError before any chunk work if the request is unusable
    SendResult run();

    // Async-signal-safe stop request
    void stop();

    SenderApp(const SenderApp&) = delete;
    SenderApp& operator=(const SenderApp&) = delete;

private:
    void validate_request() const;
    std::vector<Chunk> read_chunks(const std::string& filename, std::string& file_hash);
    bool confirm_capacity(u32 total);
    void publish(const std::vector<WireRecord>& records, SendResult& res);

    SenderOptions               opts_;
    const crypto::CryptoEngine* engine_;
    SymbolCodec*                symbols_;
    crypto::Password            password_;
    ConfirmFn                   confirm_;
    std::atomic<bool>           stopped_{false};
    std::atomic<ChunkEncoder*>  encoder_{nullptr};
};

// Routes SIGINT/SIGTERM to app.stop() while in scope. The handlers and
// the app pointer are reset on every exit path, including exceptions.
class StopOnSignal {
public:
    explicit StopOnSignal(SenderApp& app);
    ~StopOnSignal();

    // App currently bound, or nullptr
    static SenderApp* active();

    StopOnSignal(const StopOnSignal&) = delete;
    StopOnSignal& operator=(const StopOnSignal&) = delete;
};
