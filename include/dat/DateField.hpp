#pragma once
#include <optional>
#include <string>

namespace dat {

struct DateFieldParts {
    std::string date_time;
    std::optional<std::string> user_id;
    std::optional<std::string> be_id;
};

// "2023/10/10(火) 12:34:56 ID:abcdefgh12 BE:12345678" -> date, ID, BE.
// " ID:" is searched first and " BE:" only in the text after it; without an
// ID the whole field is searched for " BE:". Never fails.
DateFieldParts split_date_field(const std::string& field);

}
