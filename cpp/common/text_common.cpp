// faraid/cpp/common/text_common.cpp
#include "text_common.h"

#include <algorithm>
#include <cstdint>

namespace {

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// length of a well-formed UTF-8 sequence at s[i], 0 if malformed
static inline size_t utf8_seq_len(std::string_view s, size_t i) {
    const unsigned char c0 = (unsigned char)s[i];
    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return 0;

    if (i + len > s.size()) return 0;
    for (size_t j = 1; j < len; ++j) {
        if (!is_cont((unsigned char)s[i + j])) return 0;
    }
    return len;
}

static inline bool is_ascii_alnum_lower(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
}

// U+2019 RIGHT SINGLE QUOTATION MARK, common in pasted "Son’s"
static inline bool is_curly_apostrophe(std::string_view s, size_t i) {
    return i + 2 < s.size() && (unsigned char)s[i] == 0xE2 &&
           (unsigned char)s[i + 1] == 0x80 && (unsigned char)s[i + 2] == 0x99;
}

} // namespace

void normalize_label_to(std::string_view s, std::string& out) {
    out.clear();
    out.reserve(s.size());

    bool prev_space = true;

    for (size_t i = 0; i < s.size();) {
        const unsigned char b = (unsigned char)s[i];

        // ASCII fast path
        if (b < 0x80) {
            unsigned char c = b;
            if (c >= 'A' && c <= 'Z') c = (unsigned char)(c - 'A' + 'a');

            if (is_ascii_alnum_lower(c)) {
                out.push_back((char)c);
                prev_space = false;
            } else if (c == '\'' || c == '`') {
                // dropped, no break
            } else if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
            ++i;
            continue;
        }

        if (is_curly_apostrophe(s, i)) {
            i += 3;
            continue;
        }

        const size_t len = utf8_seq_len(s, i);
        if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
        i += (len == 0 ? 1 : len);
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
}

std::string normalize_label(std::string_view s) {
    std::string out;
    normalize_label_to(s, out);
    return out;
}

std::vector<std::string_view> label_tokens(std::string_view normalized) {
    std::vector<std::string_view> out;
    const size_t n = normalized.size();
    size_t i = 0;

    while (i < n) {
        while (i < n && normalized[i] == ' ') ++i;
        if (i >= n) break;

        const size_t start = i;
        while (i < n && normalized[i] != ' ') ++i;
        out.push_back(normalized.substr(start, i - start));
    }
    return out;
}

bool has_token(const std::vector<std::string_view>& tokens, std::string_view t) {
    return std::find(tokens.begin(), tokens.end(), t) != tokens.end();
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
