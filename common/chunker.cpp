// ============================================================
// chunker.cpp -- Line-aligned splitting of file text into chunk bodies
// ============================================================

#include "chunker.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include <stdexcept>

using namespace chunker;

LineChunker::LineChunker(size_t max_bytes, Sink sink)
    : max_bytes_(max_bytes), sink_(std::move(sink))
{
    if (max_bytes_ == 0) throw std::invalid_argument("chunk cap must be positive");
    if (!sink_) throw std::invalid_argument("chunk sink is required");
}

void LineChunker::feed(const std::string& line) {
    if (line.empty()) return;
    if (!acc_.empty() && acc_.size() + line.size() > max_bytes_) {
        flush();
    }
    acc_ += line;
}

void LineChunker::finish() {
    if (!acc_.empty()) flush();
}

void LineChunker::flush() {
    if (acc_.size() > max_bytes_) {
        ++oversize_;
        LOG_DEBUG("Chunk " + std::to_string(emitted_ + 1) + " exceeds cap (" +
                  std::to_string(acc_.size()) + " > " + std::to_string(max_bytes_) +
                  " bytes): single line not split");
    }
    ++emitted_;
    std::string body;
    body.swap(acc_);
    sink_(std::move(body));
}

std::vector<std::string> chunker::split(const std::string& content, size_t max_bytes) {
    std::vector<std::string> out;
    LineChunker lc(max_bytes, [&out](std::string&& b) { out.push_back(std::move(b)); });

    size_t pos = 0;
    while (pos < content.size()) {
        size_t nl = content.find('\n', pos);
        size_t end = (nl == std::string::npos) ? content.size() : nl + 1;
        lc.feed(content.substr(pos, end - pos));
        pos = end;
    }
    lc.finish();
    return out;
}

size_t chunker::split_stream(file_io::TextLineReader& reader, size_t max_bytes,
                             const LineChunker::Sink& sink,
                             const std::function<void(const std::string&)>& on_line) {
    LineChunker lc(max_bytes, sink);
    std::string line;
    while (reader.next_line(line)) {
        if (on_line) on_line(line);
        lc.feed(line);
    }
    lc.finish();
    return lc.chunks_emitted();
}
