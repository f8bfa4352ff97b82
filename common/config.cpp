// ============================================================
// config.cpp -- Persistent tool configuration
// ============================================================

#include "config.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "thread_pool.hpp"
#include "utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

// ============================================================
// Config
// ============================================================

size_t Config::plain_cap() const {
    return (size_t)std::floor((double)max_symbol_bytes * safety_margin);
}

size_t Config::chunk_cap(bool encrypted) const {
    size_t cap = plain_cap();
    if (!encrypted) return cap;
    // base64 expands 3 -> 4; salt, iv and padding need the rest
    size_t enc = cap * 3 / 4;
    enc = enc > ENCRYPTED_CAP_OVERHEAD ? enc - ENCRYPTED_CAP_OVERHEAD : 0;
    return enc < MIN_ENCRYPTED_CAP ? MIN_ENCRYPTED_CAP : enc;
}

size_t Config::worker_count() const {
    return max_workers ? (size_t)max_workers : ThreadPool::default_size();
}

SymbolOptions Config::symbol_options() const {
    SymbolOptions o;
    o.box_size         = box_size;
    o.border           = border;
    o.error_correction = error_correction;
    return o;
}

void Config::validate() const {
    if (max_symbol_bytes < 100)
        throw InputError("max_symbol_bytes must be at least 100");
    if (!(safety_margin > 0.0 && safety_margin <= 1.0))
        throw InputError("safety_margin must be in (0, 1]");
    if (plain_cap() == 0)
        throw InputError("Chunk cap is zero");
    if (box_size == 0)
        throw InputError("box_size must be positive");
    if (max_workers > 64)
        throw InputError("max_workers must be at most 64");
    if (error_correction != 'L' && error_correction != 'M' &&
        error_correction != 'Q' && error_correction != 'H')
        throw InputError("error_correction must be one of L, M, Q, H");
}

// ============================================================
// ConfigStore
// ============================================================

std::string ConfigStore::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/qrcp/config";
    const char* home = std::getenv("HOME");
#ifdef _WIN32
    if (!home || !*home) home = std::getenv("USERPROFILE");
#endif
    if (home && *home) return std::string(home) + "/.config/qrcp/config";
    return ".qrcp_config";
}

bool ConfigStore::apply(Config& cfg, const std::string& key, const std::string& value) {
    u32 n = 0;
    double d = 0.0;
    bool ok = true;
    Config next = cfg;

    if (key == "max_symbol_bytes") {
        ok = utils::parse_u32(value, n);
        next.max_symbol_bytes = n;
    } else if (key == "safety_margin") {
        ok = utils::parse_double(value, d);
        next.safety_margin = d;
    } else if (key == "capacity_warning") {
        ok = utils::parse_u32(value, n);
        next.capacity_warning = n;
    } else if (key == "parallel_threshold") {
        ok = utils::parse_u32(value, n);
        next.parallel_threshold = n;
    } else if (key == "max_workers") {
        ok = utils::parse_u32(value, n);
        next.max_workers = n;
    } else if (key == "box_size") {
        ok = utils::parse_u32(value, n);
        next.box_size = n;
    } else if (key == "border") {
        ok = utils::parse_u32(value, n);
        next.border = n;
    } else if (key == "error_correction") {
        ok = value.size() == 1;
        if (ok) next.error_correction = (char)std::toupper((unsigned char)value[0]);
    } else if (key == "output_dir") {
        ok = utils::validate_path(value);
        next.output_dir = value;
    } else if (key == "log_file") {
        next.log_file = value;
    } else {
        LOG_WARN("Config: unknown key '" + key + "' ignored");
        return false;
    }

    if (!ok) {
        LOG_WARN("Config: malformed value for '" + key + "': '" + value + "'");
        return false;
    }

    try {
        next.validate();
    } catch (const InputError& e) {
        LOG_WARN("Config: " + std::string(e.what()) + "; keeping " + key + " unchanged");
        return false;
    }
    cfg = next;
    return true;
}

bool ConfigStore::load(Config& cfg) const {
    std::ifstream f(path_);
    if (!f) return false;

    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t sp = line.find_first_of(" \t");
        std::string key   = line.substr(0, sp);
        std::string value = sp == std::string::npos ? "" : utils::trim(line.substr(sp));
        if (!apply(cfg, key, value)) {
            LOG_DEBUG("Config: " + path_ + ":" + std::to_string(lineno) + " skipped");
        }
    }
    LOG_DEBUG("Config loaded from " + path_);
    return true;
}

void ConfigStore::save(const Config& cfg) const {
    std::string body = "# qrcp configuration\n" + dump(cfg);
    file_io::write_file_atomic(path_, body);
}

Config ConfigStore::reset() const {
    Config cfg;
    save(cfg);
    return cfg;
}

std::string ConfigStore::dump(const Config& cfg) {
    std::ostringstream ss;
    ss << "max_symbol_bytes "   << cfg.max_symbol_bytes   << "\n";
    ss << "safety_margin "      << cfg.safety_margin      << "\n";
    ss << "capacity_warning "   << cfg.capacity_warning   << "\n";
    ss << "parallel_threshold " << cfg.parallel_threshold << "\n";
    ss << "max_workers "        << cfg.max_workers        << "\n";
    ss << "box_size "           << cfg.box_size           << "\n";
    ss << "border "             << cfg.border             << "\n";
    ss << "error_correction "   << cfg.error_correction   << "\n";
    ss << "output_dir "         << cfg.output_dir         << "\n";
    ss << "log_file "           << cfg.log_file           << "\n";
    return ss.str();
}

std::string ConfigStore::sample() {
    Config d;
    std::ostringstream ss;
    ss << "# qrcp sample configuration\n"
       << "#\n"
       << "# Largest payload a single symbol can carry (QR v40-L byte mode: 2953)\n"
       << "max_symbol_bytes " << d.max_symbol_bytes << "\n"
       << "# Fraction of max_symbol_bytes used for chunk bodies, the rest is framing\n"
       << "safety_margin " << d.safety_margin << "\n"
       << "# Ask for confirmation when a file needs more chunks than this\n"
       << "capacity_warning " << d.capacity_warning << "\n"
       << "# Encode in parallel when there are more chunks than this\n"
       << "parallel_threshold " << d.parallel_threshold << "\n"
       << "# Encoder threads, 0 = min(8, cores + 2)\n"
       << "max_workers " << d.max_workers << "\n"
       << "# Symbol rendering\n"
       << "box_size " << d.box_size << "\n"
       << "border " << d.border << "\n"
       << "error_correction " << d.error_correction << "\n"
       << "# Where chunk files and rebuilt files go\n"
       << "output_dir " << d.output_dir << "\n"
       << "# Append log lines here as well (empty = off)\n"
       << "log_file\n";
    return ss.str();
}
