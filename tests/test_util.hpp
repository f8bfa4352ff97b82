#pragma once

// ============================================================
// test_util.hpp -- Shared fixtures for qrcp tests
// ============================================================

#include "common/hash.hpp"
#include "common/protocol.hpp"
#include "common/symbol_codec.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace testutil {

// Low PBKDF2 cost so encryption tests stay fast
constexpr int TEST_ITERATIONS = 1000;

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream ss;
        ss << "qrcp_test_" << std::hex << rd() << rd();
        path_ = fs::temp_directory_path() / ss.str();
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str(const std::string& sub = "") const {
        return sub.empty() ? path_.string() : (path_ / sub).string();
    }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& data) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(data.data(), (std::streamsize)data.size());
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline size_t count_files(const std::string& dir, const std::string& ext) {
    size_t n = 0;
    for (auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file() && e.path().extension() == ext) ++n;
    }
    return n;
}

// Chunks of `bodies` as one file, with the matching file hash
inline std::vector<Chunk> make_chunks(const std::string& filename,
                                      const std::vector<std::string>& bodies) {
    std::string all;
    for (auto& b : bodies) all += b;
    std::string fh = hash::file_hash(all);

    std::vector<Chunk> out;
    for (size_t i = 0; i < bodies.size(); ++i) {
        Chunk c;
        c.index     = (u32)(i + 1);
        c.total     = (u32)bodies.size();
        c.filename  = filename;
        c.body      = bodies[i];
        c.file_hash = fh;
        out.push_back(c);
    }
    return out;
}

// In-memory symbol codec: an "image" is the payloads joined by 0x1E
class FakeSymbolCodec : public SymbolCodec {
public:
    std::vector<u8> encode_symbol(const std::string& payload, const SymbolOptions& opts) override {
        last_options = opts;
        ++encoded;
        std::string img = "FAKEIMG\x1e" + payload;
        return std::vector<u8>(img.begin(), img.end());
    }

    std::vector<std::string> decode_symbols(const std::vector<u8>& image) override {
        std::string s(image.begin(), image.end());
        std::vector<std::string> out;
        const std::string magic = "FAKEIMG\x1e";
        if (s.compare(0, magic.size(), magic) != 0) return out;
        size_t pos = magic.size();
        while (pos <= s.size()) {
            size_t sep = s.find('\x1e', pos);
            if (sep == std::string::npos) sep = s.size();
            out.push_back(s.substr(pos, sep - pos));
            pos = sep + 1;
        }
        return out;
    }

    static std::vector<u8> image_of(const std::vector<std::string>& payloads) {
        std::string img = "FAKEIMG";
        for (auto& p : payloads) img += "\x1e" + p;
        return std::vector<u8>(img.begin(), img.end());
    }

    SymbolOptions last_options;
    int encoded{0};
};

} // namespace testutil
