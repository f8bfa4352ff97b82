// ============================================================
// file_io.cpp -- Text input streaming and safe output writes
// ============================================================

#include "file_io.hpp"
#include "text.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <random>
#include <stdexcept>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// TextLineReader
// ============================================================

TextLineReader::TextLineReader(const std::string& path)
    : in_(path, std::ios::binary), path_(path)
{
    if (!in_) {
        throw std::runtime_error("Cannot open file: " + path);
    }
}

bool TextLineReader::next_line(std::string& line) {
    std::string raw;
    if (!std::getline(in_, raw)) {
        if (in_.bad()) throw std::runtime_error("Read error: " + path_);
        return false;
    }
    bytes_read_ += raw.size();
    if (!in_.eof()) {
        raw.push_back('\n');
        bytes_read_ += 1;
    }

    if (first_) {
        first_ = false;
        if (text::has_bom(raw)) {
            had_bom_ = true;
            raw.erase(0, 3);
        }
    }

    if (text::is_valid_utf8(raw)) {
        line = std::move(raw);
    } else {
        had_invalid_ = true;
        line = text::sanitize_utf8(raw);
    }
    ++lines_read_;
    return true;
}

// ============================================================
// Utility functions
// ============================================================

std::string file_io::read_text_file(const std::string& path) {
    TextLineReader reader(path);
    std::string out, line;
    while (reader.next_line(line)) out += line;
    return out;
}

std::string file_io::read_raw_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw std::runtime_error("Read error: " + path);
    return ss.str();
}

void file_io::write_file_atomic(const std::string& path, const std::string& data) {
    ensure_parent_dirs(path);

    std::random_device rd;
    std::string tmp = path + ".tmp" + std::to_string(rd() & 0xFFFFFF);

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("Cannot create file: " + tmp);
        f.write(data.data(), (std::streamsize)data.size());
        f.flush();
        if (!f) {
            f.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Write failed: " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(tmp, ec2);
        throw std::runtime_error("Cannot move " + tmp + " to " + path + ": " + ec.message());
    }
}

fs::path file_io::safe_join(const fs::path& root_dir, const std::string& relative_path) {
    if (relative_path.empty()) {
        throw std::runtime_error("Empty relative path");
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\' ||
        relative_path.find(':') != std::string::npos) {
        throw std::runtime_error("Absolute path rejected: " + relative_path);
    }

    fs::path rel(relative_path);
    if (rel.is_absolute() || rel.has_root_name()) {
        throw std::runtime_error("Absolute path rejected: " + relative_path);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw std::runtime_error("Path traversal rejected: " + relative_path);
        }
    }
    // Windows separators in a name coming off the wire
    if (relative_path.find("..\\") != std::string::npos ||
        relative_path.find("\\..") != std::string::npos) {
        throw std::runtime_error("Path traversal rejected: " + relative_path);
    }

    return (root_dir / rel).lexically_normal();
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

std::vector<std::string> file_io::list_files(const std::string& dir,
                                             const std::vector<std::string>& exts) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) throw std::runtime_error("Cannot list directory: " + dir + ": " + ec.message());

    for (const auto& entry : it) {
        std::error_code sec;
        if (!entry.is_regular_file(sec)) continue;
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return (char)std::tolower(c); });
        if (std::find(exts.begin(), exts.end(), ext) == exts.end()) continue;
        out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}
