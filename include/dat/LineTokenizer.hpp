#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dat {

// Field separator of the dat format.
inline const std::string kFieldDelimiter = "<>";

struct LineFields {
    std::string name;
    std::string email;
    std::string date_field;              // date + optional " ID:" / " BE:"
    std::string raw_body;                // still entity-encoded
    std::optional<std::string> title;    // only when a 5th field exists
};

// Splits a line on "<>". Returns nullopt for lines with fewer than four fields.
// field_count, when given, receives the number of fields found either way.
std::optional<LineFields> tokenize_line(const std::string& line, size_t* field_count = nullptr);

// true when name, email, date and body all hold the deleted-post marker
bool is_deleted_line(const LineFields& f);

}
