#pragma once

#include <cstddef>
#include <string>

namespace verify {

enum class TeenPolicy {
    Band,     // kTeenMinAge <= age <= kTeenMaxAge
    Under18   // age < kMinorAgeLimit
};

constexpr int kTeenMinAge = 13;
constexpr int kTeenMaxAge = 19;
constexpr int kMinorAgeLimit = 18;

// Which teen rule the engine applies when nothing else is configured.
constexpr TeenPolicy kDefaultTeenPolicy = TeenPolicy::Band;

struct VerifyConfig {
    double name_threshold = 0.80;   // accept name if similarity >= threshold
    TeenPolicy teen_policy = kDefaultTeenPolicy;

    // Aadhaar rules: first digit 2-9 and a valid Verhoeff check digit
    bool strict_id_format = false;

    size_t max_name_length = 40;    // longer name candidates are OCR junk
};

// "band" | "under18"; throws InvalidInputError on anything else
TeenPolicy parse_teen_policy(const std::string& s);
const char* teen_policy_name(TeenPolicy p);

// throws InvalidInputError if a field is out of range
void validate_config(const VerifyConfig& cfg);

}  // namespace verify
