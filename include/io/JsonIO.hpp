#pragma once

#include <string>

#include "verify/Report.hpp"
#include "verify/VerifyConfig.hpp"

// Reference record JSON:
//   { "name": "...", "dob": "...", "id_number": "..." }
// "idNumber" and "aadhaar" are accepted for the id field. Missing fields load
// as empty strings; a non-object root or a non-string field throws
// verify::InvalidInputError.
verify::ReferenceRecord parseReferenceRecord(const std::string& json_text, const std::string& where = "reference");
verify::ReferenceRecord loadReferenceRecord(const std::string& path);

// Config JSON (every key optional, unknown keys ignored):
//   { "name_threshold": 0.8, "teen_policy": "band", "strict_id_format": false, "max_name_length": 40 }
verify::VerifyConfig parseVerifyConfig(const std::string& json_text,
                                       const verify::VerifyConfig& base = {},
                                       const std::string& where = "config");
verify::VerifyConfig loadVerifyConfig(const std::string& path, const verify::VerifyConfig& base = {});
