#pragma once

// ============================================================
// text.hpp -- UTF-8 handling for line-oriented text input
// ============================================================

#include "platform.hpp"
#include <string>

namespace text {

// "\xEF\xBB\xBF"
extern const char* const UTF8_BOM;

// U+FFFD
extern const char* const REPLACEMENT_CHAR;

// Remove one leading UTF-8 byte order mark, if present
std::string strip_bom(const std::string& s);
bool has_bom(const std::string& s);

// Replace each maximal invalid subsequence with U+FFFD
std::string sanitize_utf8(const std::string& s);

bool is_valid_utf8(const std::string& s);

// Number of code points; s must be valid UTF-8
size_t utf8_length(const std::string& s);

} // namespace text
