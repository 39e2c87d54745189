#pragma once
#include <string>
#include <vector>

namespace dat {

struct ParsedBody {
    std::string body;                     // decoded, <br> -> '\n', lines trimmed
    std::vector<long long> reply_targets; // ">>N" anchors in order, duplicates kept
};

// Collects N from every "&gt;&gt;N" in still-encoded text. N is a run of
// Unicode decimal digits of any script; values past LLONG_MAX saturate.
std::vector<long long> extract_reply_targets(const std::string& encoded);

// Full body pipeline: strip <a> tags, scan anchors, decode entities,
// convert <br>, trim each line.
ParsedBody parse_body(const std::string& raw_body);

}
