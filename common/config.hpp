#pragma once

// ============================================================
// config.hpp -- Persistent tool configuration
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "symbol_codec.hpp"
#include <string>
#include <vector>

struct Config {
    u32         max_symbol_bytes   = DEFAULT_MAX_SYMBOL_BYTES;
    double      safety_margin      = DEFAULT_SAFETY_MARGIN;
    u32         capacity_warning   = DEFAULT_CAPACITY_WARNING;
    u32         parallel_threshold = DEFAULT_PARALLEL_THRESHOLD;
    u32         max_workers        = 0;     // 0 = ThreadPool::default_size()
    u32         box_size           = 10;
    u32         border             = 4;
    char        error_correction   = 'L';   // L, M, Q or H
    std::string output_dir         = ".";
    std::string log_file;

    // floor(max_symbol_bytes * safety_margin)
    size_t plain_cap() const;

    // Body cap; reduced when encrypting so the base64 payload still fits
    size_t chunk_cap(bool encrypted) const;

    size_t worker_count() const;

    SymbolOptions symbol_options() const;

    // Throws InputError describing the first invalid value
    void validate() const;
};

// Reads and writes the config as "key value" lines with '#' comments.
// Unknown keys and malformed values are warned about and skipped.
class ConfigStore {
public:
    explicit ConfigStore(const std::string& path) : path_(path) {}

    // $XDG_CONFIG_HOME/qrcp/config, else $HOME/.config/qrcp/config
    static std::string default_path();

    const std::string& path() const { return path_; }

    // Returns false if the file does not exist (cfg left untouched)
    bool load(Config& cfg) const;

    // Overwrite the file with cfg; throws on I/O failure
    void save(const Config& cfg) const;

    // Rewrite with defaults and return them
    Config reset() const;

    // Apply one "key value" pair; returns false (and warns) if rejected
    static bool apply(Config& cfg, const std::string& key, const std::string& value);

    // "key value" listing of every setting
    static std::string dump(const Config& cfg);

    // Commented sample file text
    static std::string sample();

private:
    std::string path_;
};
