#include "dat/HtmlText.hpp"
#include "dat/TextUtil.hpp"
#include "dat/UnicodeClass.hpp"

#include <cctype>
#include <unordered_map>

namespace dat {

namespace {

struct NamedEntity {
    const char* name;  // "gt;"; legacy names are also listed without the ';'
    char32_t first;
    char32_t second;   // 0 unless the reference expands to two code points
};

const NamedEntity kNamedEntities[] = {
#include "dat/Html5Entities.inc"
};

const std::unordered_map<std::string, const NamedEntity*>& entity_table() {
    static const std::unordered_map<std::string, const NamedEntity*> table = [] {
        std::unordered_map<std::string, const NamedEntity*> t;
        t.reserve(sizeof(kNamedEntities) / sizeof(kNamedEntities[0]));
        for (const auto& e : kNamedEntities) t.emplace(e.name, &e);
        return t;
    }();
    return table;
}

void append_entity(std::string& out, const NamedEntity& e) {
    textutil::append_utf8(out, e.first);
    if (e.second) textutil::append_utf8(out, e.second);
}

// windows-1252 meanings of &#128; .. &#159;, 0 where the byte is unassigned
const char32_t kCp1252High[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

const char32_t kReplacement = 0xFFFD;

bool is_dropped_code_point(char32_t cp) {
    if ((cp >= 0x01 && cp <= 0x08) || cp == 0x0B || (cp >= 0x0E && cp <= 0x1F)) return true;
    if (cp >= 0x7F && cp <= 0x9F) return true;
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return true;
    return (cp & 0xFFFE) == 0xFFFE;  // U+xFFFE / U+xFFFF noncharacters
}

// Appends the decoded numeric reference; cp is already clamped to 0x110000.
void append_numeric(std::string& out, char32_t cp) {
    if (cp == 0x00) {
        textutil::append_utf8(out, kReplacement);
        return;
    }
    if (cp == 0x0D) {
        out.push_back('\r');
        return;
    }
    if (cp >= 0x80 && cp <= 0x9F) {
        char32_t mapped = kCp1252High[cp - 0x80];
        textutil::append_utf8(out, mapped ? mapped : cp);
        return;
    }
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        textutil::append_utf8(out, kReplacement);
        return;
    }
    if (is_dropped_code_point(cp)) return;
    textutil::append_utf8(out, cp);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Tries to decode a numeric reference at s[i] == '&', s[i+1] == '#'.
// Returns the position after the reference, or i when there is none.
size_t decode_numeric_at(const std::string& s, size_t i, std::string& out) {
    size_t j = i + 2;
    int base = 10;
    if (j < s.size() && (s[j] == 'x' || s[j] == 'X')) {
        base = 16;
        ++j;
    }

    const size_t digits_start = j;
    char32_t cp = 0;
    while (j < s.size()) {
        int v = (base == 16) ? hex_value(s[j]) : (std::isdigit(static_cast<unsigned char>(s[j])) ? s[j] - '0' : -1);
        if (v < 0) break;
        if (cp <= 0x10FFFF) cp = cp * base + static_cast<char32_t>(v);
        if (cp > 0x10FFFF) cp = 0x110000;
        ++j;
    }
    if (j == digits_start) return i;

    if (j < s.size() && s[j] == ';') ++j;
    append_numeric(out, cp);
    return j;
}

bool is_name_char(char c) {
    return c != '\t' && c != '\n' && c != '\f' && c != ' ' && c != '<' && c != '&' && c != '#' && c != ';';
}

// Tries to decode a named reference at s[i] == '&'.
// Returns the position after the consumed text, or i when nothing matched.
size_t decode_named_at(const std::string& s, size_t i, std::string& out) {
    const auto& table = entity_table();

    // up to 32 name characters (code points) and an optional ';'
    size_t j = i + 1;
    size_t chars = 0;
    while (j < s.size() && chars < 32 && is_name_char(s[j])) {
        size_t len = 0;
        textutil::decode_utf8(s, j, len);
        j += len;
        ++chars;
    }
    if (chars == 0) return i;
    if (j < s.size() && s[j] == ';') ++j;

    const std::string ref = s.substr(i + 1, j - (i + 1));
    auto it = table.find(ref);
    if (it != table.end()) {
        append_entity(out, *it->second);
        return j;
    }

    // "&copyright;" -> "(c)right;": longest legacy prefix wins, rest stays literal
    for (size_t len = ref.size() - 1; len >= 2; --len) {
        auto p = table.find(ref.substr(0, len));
        if (p != table.end()) {
            append_entity(out, *p->second);
            out.append(ref, len, std::string::npos);
            return j;
        }
    }
    return i;
}

char lower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool matches_icase(const std::string& s, size_t pos, const char* lit) {
    for (size_t k = 0; lit[k]; ++k) {
        if (pos + k >= s.size() || lower_ascii(s[pos + k]) != lit[k]) return false;
    }
    return true;
}

bool is_word_at(const std::string& s, size_t i) {
    size_t len = 0;
    return is_word_char(textutil::decode_utf8(s, i, len));
}

size_t find_icase(const std::string& s, size_t from, const char* lit) {
    for (size_t p = from; p < s.size(); ++p) {
        if (matches_icase(s, p, lit)) return p;
    }
    return std::string::npos;
}

}  // namespace

std::string strip_anchor_tags(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    size_t copied = 0;
    while (i < s.size()) {
        // "<a" followed by a word boundary
        if (!matches_icase(s, i, "<a") || i + 2 >= s.size() || is_word_at(s, i + 2)) {
            ++i;
            continue;
        }

        size_t open_end = s.find('>', i + 2);
        if (open_end == std::string::npos) {
            ++i;
            continue;
        }
        size_t close = find_icase(s, open_end + 1, "</a>");
        if (close == std::string::npos) {
            ++i;
            continue;
        }

        out.append(s, copied, i - copied);
        out.append(s, open_end + 1, close - (open_end + 1));
        i = close + 4;
        copied = i;
    }
    out.append(s, copied, std::string::npos);
    return out;
}

std::string decode_entities(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '&') {
            out.push_back(s[i]);
            ++i;
            continue;
        }

        size_t next = i;
        if (i + 1 < s.size() && s[i + 1] == '#') {
            next = decode_numeric_at(s, i, out);
        } else {
            next = decode_named_at(s, i, out);
        }

        if (next == i) {
            out.push_back('&');
            ++i;
        } else {
            i = next;
        }
    }
    return out;
}

std::string normalize_line_breaks(const std::string& s) {
    return textutil::replace_all(s, "<br>", "\n");
}

std::string trim_lines(const std::string& s) {
    std::vector<std::string> lines = textutil::split(s, "\n");
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.push_back('\n');
        out += textutil::strip(lines[i]);
    }
    return out;
}

}  // namespace dat
