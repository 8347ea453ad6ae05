#pragma once

#include <string>

#include "extract/FieldExtractor.hpp"
#include "verify/Report.hpp"

namespace verify {

// Console summary:
//   All details match: Yes|No
//   Name matches: Yes|No (<value>|Not found)
//   ...
//   Extracted Details:
//   ...
//   Age: N (Teen|Not teen)
std::string render_text_summary(const VerificationReport& report);

// Extracted fields only (the `extract` command)
std::string render_extracted(const extract::ExtractedFields& fields);

}  // namespace verify
