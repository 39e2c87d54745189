#include "dat/LineTokenizer.hpp"
#include "dat/DatEntry.hpp"
#include "dat/TextUtil.hpp"

namespace dat {

std::optional<LineFields> tokenize_line(const std::string& line, size_t* field_count) {
    std::vector<std::string> parts = textutil::split(line, kFieldDelimiter);
    if (field_count) *field_count = parts.size();
    if (parts.size() < 4) return std::nullopt;

    LineFields f;
    f.name = std::move(parts[0]);
    f.email = std::move(parts[1]);
    f.date_field = std::move(parts[2]);
    f.raw_body = std::move(parts[3]);
    if (parts.size() >= 5) f.title = std::move(parts[4]);
    return f;
}

bool is_deleted_line(const LineFields& f) {
    return f.name == kDeletedMarker && f.email == kDeletedMarker &&
           f.date_field == kDeletedMarker && f.raw_body == kDeletedMarker;
}

}  // namespace dat
