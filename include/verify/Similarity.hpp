#pragma once

#include <cstddef>
#include <string>

namespace verify {

// insert/delete/substitute, unit cost
size_t levenshtein(const std::string& a, const std::string& b);

// 1 - distance / max(len); two empty strings are identical (1.0)
double edit_similarity(const std::string& a, const std::string& b);

// upper-case, non-alphanumerics to spaces, whitespace collapsed
std::string normalize_name(const std::string& s);

// normalize_name, then tokens sorted and re-joined with single spaces
std::string sorted_token_form(const std::string& s);

// max(edit_similarity of normalized forms, edit_similarity of sorted-token forms)
double name_similarity(const std::string& a, const std::string& b);

}  // namespace verify
