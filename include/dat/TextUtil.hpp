#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace textutil {

// split on every occurrence of delim; empty fields are kept
std::vector<std::string> split(const std::string& s, const std::string& delim);

// strip leading/trailing whitespace, including the UTF-8 encoded Unicode spaces
// (U+00A0, U+3000, ...) that show up in Japanese board text
std::string strip(const std::string& s);
std::string rstrip(const std::string& s);

std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// number of UTF-8 code points (malformed bytes count as one each)
size_t utf8_length(const std::string& s);

// first n code points of s
std::string utf8_prefix(const std::string& s, size_t n);

// code point starting at s[i]; len receives its byte length. Malformed or
// truncated sequences decode to U+FFFD with len 1.
char32_t decode_utf8(const std::string& s, size_t i, size_t& len);

// append the UTF-8 encoding of cp
void append_utf8(std::string& out, char32_t cp);

}
