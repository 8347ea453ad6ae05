#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim(const std::string& s);

std::string to_upper_ascii(std::string s);
std::string to_lower_ascii(std::string s);

// collapse runs of whitespace into one space, then trim
std::string collapse_spaces(const std::string& s);

// split on '\n', dropping '\r'; keeps empty lines
std::vector<std::string> split_lines(const std::string& s);

// split on spaces, no empty tokens
std::vector<std::string> tokenize_words(const std::string& s);

// true if the (trimmed) line is nothing but a field label such as "Name:" or "DOB"
bool is_label_only_line(const std::string& line);

// OCR cleanup before pattern search:
// - per-line whitespace collapse + trim, blank lines dropped
// - a label-only line is joined with the next line as "<label>: <value>"
// - casing is preserved
std::string normalize_ocr(const std::string& raw);

}
