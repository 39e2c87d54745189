#pragma once
#include <optional>
#include <string>
#include <vector>

namespace dat {

// Placeholder written into every field of a deleted post.
inline const std::string kDeletedMarker = "\xE3\x81\x82\xE3\x81\xBC\xE3\x83\xBC\xE3\x82\x93";  // "あぼーん"

// One post of a thread. The post number is the 1-based position in the
// thread and is not stored here.
struct DatEntry {
    std::string name;                   // verbatim
    std::string email;                  // verbatim, "sage" etc.
    std::string date_time;              // date/time with ID/BE removed
    std::optional<std::string> user_id;
    std::optional<std::string> be_id;
    std::string body;                   // sanitized text, '\n' separated
    std::optional<std::string> title;   // 5th field when present
    std::vector<long long> reply_targets;
    bool deleted = false;               // built from a deleted-post line

    bool is_deleted() const { return deleted; }
};

}
