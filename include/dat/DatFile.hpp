#pragma once
#include <string>
#include <vector>

namespace dat {

// Splits UTF-8 dat text into lines: drops a leading BOM and a trailing '\r'
// on each line; a final newline does not produce an empty last line.
std::vector<std::string> split_dat_text(const std::string& text);

// Reads a UTF-8 dat file (convert Shift_JIS files beforehand, e.g. with iconv).
// Throws std::runtime_error when the file cannot be opened.
std::vector<std::string> load_dat_lines(const std::string& path);

}
