// ============================================================
// text.cpp -- UTF-8 handling for line-oriented text input
// ============================================================

#include "text.hpp"

namespace text {

const char* const UTF8_BOM         = "\xEF\xBB\xBF";
const char* const REPLACEMENT_CHAR = "\xEF\xBF\xBD";

namespace {

// Length of the well-formed sequence starting at s[i], or 0 if it is not
// well-formed. On 0, *bad receives the length of the maximal subpart to
// replace (at least 1).
size_t decode_one(const std::string& s, size_t i, size_t* bad) {
    const u8 b0 = (u8)s[i];
    const size_t n = s.size();

    if (b0 < 0x80) return 1;

    size_t need;
    u8 lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        *bad = 1;
        return 0;
    }

    size_t k = 1;
    for (; k <= need; ++k) {
        if (i + k >= n) break;
        const u8 c = (u8)s[i + k];
        const u8 l = (k == 1) ? lo : 0x80;
        const u8 h = (k == 1) ? hi : 0xBF;
        if (c < l || c > h) break;
    }
    if (k == need + 1) return need + 1;
    *bad = k;
    return 0;
}

} // namespace

bool has_bom(const std::string& s) {
    return s.size() >= 3 && s.compare(0, 3, UTF8_BOM) == 0;
}

std::string strip_bom(const std::string& s) {
    return has_bom(s) ? s.substr(3) : s;
}

std::string sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        size_t bad = 0;
        size_t len = decode_one(s, i, &bad);
        if (len) {
            out.append(s, i, len);
            i += len;
        } else {
            out.append(REPLACEMENT_CHAR);
            i += bad;
        }
    }
    return out;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t bad = 0;
        size_t len = decode_one(s, i, &bad);
        if (!len) return false;
        i += len;
    }
    return true;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (char c : s) {
        if (((u8)c & 0xC0) != 0x80) ++count;
    }
    return count;
}

} // namespace text
