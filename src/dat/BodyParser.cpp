#include "dat/BodyParser.hpp"
#include "dat/HtmlText.hpp"
#include "dat/TextUtil.hpp"
#include "dat/UnicodeClass.hpp"

#include <limits>

namespace dat {

static const char kEncodedAnchor[] = "&gt;&gt;";

std::vector<long long> extract_reply_targets(const std::string& encoded) {
    std::vector<long long> out;
    const size_t marker_len = sizeof(kEncodedAnchor) - 1;
    const long long kMax = std::numeric_limits<long long>::max();

    size_t pos = 0;
    while ((pos = encoded.find(kEncodedAnchor, pos)) != std::string::npos) {
        size_t i = pos + marker_len;
        long long value = 0;
        size_t ndigits = 0;

        while (i < encoded.size()) {
            size_t len = 0;
            int d = decimal_digit_value(textutil::decode_utf8(encoded, i, len));
            if (d < 0) break;
            value = (value > (kMax - d) / 10) ? kMax : value * 10 + d;
            ++ndigits;
            i += len;
        }

        if (ndigits == 0) {
            ++pos;
            continue;
        }
        out.push_back(value);
        pos = i;
    }
    return out;
}

ParsedBody parse_body(const std::string& raw_body) {
    ParsedBody result;

    std::string text = strip_anchor_tags(raw_body);

    // only the encoded form is an anchor; a literal ">>" in the text is not
    result.reply_targets = extract_reply_targets(text);

    text = decode_entities(text);
    text = normalize_line_breaks(text);
    result.body = trim_lines(text);
    return result;
}

}  // namespace dat
