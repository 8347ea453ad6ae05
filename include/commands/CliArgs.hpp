#pragma once

#include <string>
#include <vector>

#include "verify/CanonicalDate.hpp"

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// "--as_of yyyy-mm-dd" (any format parse_date accepts); today() when absent.
// Throws verify::InvalidInputError on a bad date.
verify::CanonicalDate get_as_of(int argc, char** argv);

// Resolves --text / --image into OCR passes. Returns false (after printing
// an error) if neither was given.
bool read_ocr_passes(int argc, char** argv, std::vector<std::string>& passes, std::string& source_path);

}  // namespace cli
