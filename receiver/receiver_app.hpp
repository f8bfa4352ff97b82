#pragma once

// ============================================================
// receiver_app.hpp -- qrcp receiver: chunk files / scans -> files
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/symbol_codec.hpp"
#include "chunk_collector.hpp"
#include "reassembler.hpp"
#include <string>
#include <vector>

struct ReceiverOptions {
    std::vector<std::string> inputs;        // directories or single chunk/image files
    Config                   config;
    std::string              suffix;
    bool                     verify_only{false};
    bool                     overwrite{false};
    std::string              save_chunks_dir;   // re-save accepted records (empty = off)
    std::string              report_path;       // scan report (empty = off)
};

class ReceiverApp {
public:
    // engine may be nullptr (encrypted files then fail); symbols may be nullptr
    explicit ReceiverApp(ReceiverOptions opts,
                         const crypto::CryptoEngine* engine = nullptr,
                         SymbolCodec* symbols = nullptr);

    void set_password_provider(PasswordProvider p) { provider_ = std::move(p); }
    void set_confirm_overwrite(std::function<bool(const std::string&)> fn) {
        confirm_overwrite_ = std::move(fn);
    }

    // Throws InputError if an input does not exist
    BatchReport run();

    const ChunkCollector& collector() const { return collector_; }

    ReceiverApp(const ReceiverApp&) = delete;
    ReceiverApp& operator=(const ReceiverApp&) = delete;

private:
    void collect();
    void print_summary(const BatchReport& report) const;

    ReceiverOptions                          opts_;
    const crypto::CryptoEngine*              engine_;
    ChunkCollector                           collector_;
    PasswordProvider                         provider_;
    std::function<bool(const std::string&)>  confirm_overwrite_;
};
