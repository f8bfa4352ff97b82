#pragma once

// ============================================================
// chunker.hpp -- Line-aligned splitting of file text into chunk bodies
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <functional>

namespace file_io { class TextLineReader; }

namespace chunker {

// Incremental splitter. A body boundary is only ever placed between lines;
// a line longer than max_bytes becomes (part of) an oversize body rather
// than being truncated.
class LineChunker {
public:
    using Sink = std::function<void(std::string&& body)>;

    LineChunker(size_t max_bytes, Sink sink);

    // One line including its terminator
    void feed(const std::string& line);

    // Flush the remaining accumulator (if non-empty)
    void finish();

    size_t chunks_emitted() const { return emitted_; }
    size_t oversize_chunks() const { return oversize_; }

private:
    void flush();

    size_t      max_bytes_;
    Sink        sink_;
    std::string acc_;
    size_t      emitted_{0};
    size_t      oversize_{0};
};

// Split each '\n'-terminated line of content into bodies of at most
// max_bytes (except single oversize lines). split("") returns no bodies.
std::vector<std::string> split(const std::string& content, size_t max_bytes);

// Same policy over a streamed reader; each line is also passed to on_line
// (may be empty) so callers can hash in the same pass. Returns body count.
size_t split_stream(file_io::TextLineReader& reader, size_t max_bytes,
                    const LineChunker::Sink& sink,
                    const std::function<void(const std::string&)>& on_line = nullptr);

} // namespace chunker
