#include "dat/TextUtil.hpp"

namespace textutil {

std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> out;
    if (delim.empty()) {
        out.push_back(s);
        return out;
    }

    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
    return out;
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of the whitespace character starting at s[i], 0 if none.
static size_t space_len_at(const std::string& s, size_t i) {
    const size_t n = s.size() - i;
    const unsigned char c0 = static_cast<unsigned char>(s[i]);

    if ((c0 >= 0x09 && c0 <= 0x0D) || (c0 >= 0x1C && c0 <= 0x20)) return 1;
    if (c0 < 0xC2 || n < 2) return 0;

    const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
    if (!is_continuation(c1)) return 0;
    if (c0 == 0xC2) {
        return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;  // NEL, NBSP
    }
    if (n < 3) return 0;

    const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
    if (!is_continuation(c2)) return 0;
    switch (c0) {
        case 0xE1:  // U+1680
            return (c1 == 0x9A && c2 == 0x80) ? 3 : 0;
        case 0xE2:
            if (c1 == 0x80) {
                // U+2000..U+200A, U+2028, U+2029, U+202F
                if (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) return 3;
                return 0;
            }
            return (c1 == 0x81 && c2 == 0x9F) ? 3 : 0;  // U+205F
        case 0xE3:  // U+3000
            return (c1 == 0x80 && c2 == 0x80) ? 3 : 0;
        default:
            return 0;
    }
}

static size_t strip_end(const std::string& s, size_t begin) {
    size_t j = s.size();
    while (j > begin) {
        size_t k = 0;
        for (size_t len = 1; len <= 3 && len <= j - begin; ++len) {
            if (space_len_at(s, j - len) == len) {
                k = len;
                break;
            }
        }
        if (k == 0) break;
        j -= k;
    }
    return j;
}

std::string strip(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t k = space_len_at(s, i);
        if (k == 0) break;
        i += k;
    }
    size_t j = strip_end(s, i);
    return s.substr(i, j - i);
}

std::string rstrip(const std::string& s) {
    return s.substr(0, strip_end(s, 0));
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;

    std::string out;
    out.reserve(s.size());
    size_t start = 0;
    while (true) {
        size_t pos = s.find(from, start);
        if (pos == std::string::npos) break;
        out.append(s, start, pos - start);
        out += to;
        start = pos + from.size();
    }
    out.append(s, start, std::string::npos);
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string utf8_prefix(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
        if (seen == n) return s.substr(0, i);
        ++seen;
    }
    return s;
}

char32_t decode_utf8(const std::string& s, size_t i, size_t& len) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);
    len = 1;
    if (c0 < 0x80) return c0;

    size_t need = 0;
    char32_t cp = 0;
    char32_t lowest = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
        need = 1; cp = c0 & 0x1F; lowest = 0x80;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        need = 2; cp = c0 & 0x0F; lowest = 0x800;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        need = 3; cp = c0 & 0x07; lowest = 0x10000;
    } else {
        return 0xFFFD;
    }
    if (i + need >= s.size()) return 0xFFFD;

    for (size_t k = 1; k <= need; ++k) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if (!is_continuation(c)) return 0xFFFD;
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < lowest || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0xFFFD;

    len = need + 1;
    return cp;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}
