#pragma once

// ============================================================
// file_io.hpp -- Text input streaming and safe output writes
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- TextLineReader: one forward pass over a text file ----
// Each returned line keeps its '\n' terminator (the last line may lack one).
// A leading UTF-8 BOM is dropped and invalid UTF-8 is replaced with U+FFFD,
// so the concatenation of all lines is the file's normalized text.
class TextLineReader {
public:
    explicit TextLineReader(const std::string& path);

    TextLineReader(const TextLineReader&) = delete;
    TextLineReader& operator=(const TextLineReader&) = delete;

    // Returns false at end of file
    bool next_line(std::string& line);

    // Raw bytes consumed from disk so far
    u64 bytes_read() const { return bytes_read_; }
    u64 lines_read() const { return lines_read_; }
    bool had_bom() const { return had_bom_; }
    bool had_invalid_utf8() const { return had_invalid_; }

private:
    std::ifstream in_;
    std::string   path_;
    u64  bytes_read_{0};
    u64  lines_read_{0};
    bool first_{true};
    bool had_bom_{false};
    bool had_invalid_{false};
};

// Whole-file normalized text (BOM stripped, invalid UTF-8 replaced)
std::string read_text_file(const std::string& path);

// Exact bytes of a file; throws if it cannot be read
std::string read_raw_file(const std::string& path);

// Write to a temporary file beside `path`, then rename over it.
// Throws on any failure; the temporary is removed.
void write_file_atomic(const std::string& path, const std::string& data);

// Join a record-supplied filename under root_dir.
// Throws if the name is empty, absolute, or has a ".." component.
fs::path safe_join(const fs::path& root_dir, const std::string& relative_path);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Regular files directly in dir whose extension (".txt") is in exts, sorted by name
std::vector<std::string> list_files(const std::string& dir, const std::vector<std::string>& exts);

} // namespace file_io
