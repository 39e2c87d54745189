#pragma once

namespace dat {

// Regex word character: letter or digit of any script, or '_'.
bool is_word_char(char32_t cp);

// Value 0..9 of a Unicode decimal digit (Nd), -1 for anything else.
int decimal_digit_value(char32_t cp);

}
