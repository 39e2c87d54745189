#include "dat/UnicodeClass.hpp"

#include <algorithm>
#include <iterator>

namespace dat {

namespace {

struct CodeRange {
    char32_t first;
    char32_t last;
};

// sorted, non-overlapping
const CodeRange kWordRanges[] = {
#include "dat/WordRanges.inc"
};

// first code point of each run of ten decimal digits, sorted
const char32_t kDecimalZeros[] = {
#include "dat/DecimalZeros.inc"
};

}  // namespace

bool is_word_char(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || cp == '_';
    }
    auto it = std::upper_bound(std::begin(kWordRanges), std::end(kWordRanges), cp,
                               [](char32_t v, const CodeRange& r) { return v < r.first; });
    if (it == std::begin(kWordRanges)) return false;
    --it;
    return cp <= it->last;
}

int decimal_digit_value(char32_t cp) {
    if (cp >= '0' && cp <= '9') return static_cast<int>(cp - '0');
    auto it = std::upper_bound(std::begin(kDecimalZeros), std::end(kDecimalZeros), cp);
    if (it == std::begin(kDecimalZeros)) return -1;
    --it;
    return (cp - *it < 10) ? static_cast<int>(cp - *it) : -1;
}

}  // namespace dat
