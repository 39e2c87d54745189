#pragma once
#include <string>

namespace dat {

// Replaces every <a ...>inner</a> (case-insensitive, may span lines) with its
// inner text. Unterminated tags are left untouched.
std::string strip_anchor_tags(const std::string& s);

// Decodes HTML5 named references (&gt;, &star;, &NewLine;, ...), decimal (&#62;)
// and hex (&#x3e;) references to UTF-8, following the HTML5 rules for
// references without a trailing ';' and for invalid code points. Unknown names
// are kept literally.
std::string decode_entities(const std::string& s);

// "<br>" -> "\n"
std::string normalize_line_breaks(const std::string& s);

// strips every '\n'-separated line, then rejoins with '\n'
std::string trim_lines(const std::string& s);

}
