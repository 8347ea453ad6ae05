#pragma once

#include <optional>
#include <string>

#include "verify/CanonicalDate.hpp"

namespace verify {

struct FieldMatch {
    bool matched = false;
    double similarity = 0.0;                     // [0,1]; 0 or 1 for dob and id
    std::optional<std::string> extracted_value;  // absent when the document gave nothing
    std::string expected_value;
};

// Fuzzy, case-insensitive, token-order-insensitive. Absent or empty side => no match.
FieldMatch match_name(const std::optional<std::string>& extracted, const std::string& expected, double threshold);

// Both sides normalized independently through parse_date(); either failing => no match.
FieldMatch match_dob(const std::optional<std::string>& extracted_text, const std::string& expected, int max_year);

// Digits-only equality; both sides must be exactly 12 digits.
FieldMatch match_id(const std::optional<std::string>& extracted, const std::string& expected);

}  // namespace verify
