#pragma once
#include <cstddef>
#include <string>

namespace idformat {

constexpr size_t kIdDigits = 12;

// drop every non-digit character
std::string digits_only(const std::string& s);

// exactly kIdDigits ASCII digits
bool is_well_formed(const std::string& digits);

// Verhoeff check over the whole string (last digit is the check digit)
bool verhoeff_valid(const std::string& digits);

// Aadhaar issuing rules: well formed, first digit 2-9, Verhoeff check passes
bool passes_aadhaar_rules(const std::string& digits);

// "123456789012" -> "1234 5678 9012"; other inputs are returned unchanged
std::string group_digits(const std::string& digits);

} // namespace idformat
