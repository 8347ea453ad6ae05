#pragma once

#include <string>
#include <vector>

#include "verify/CanonicalDate.hpp"
#include "verify/Report.hpp"
#include "verify/VerifyConfig.hpp"

namespace verify {

// Core entry point: raw OCR text + reference record -> report.
// Pure: identical inputs give identical reports. Throws InvalidInputError for
// a bad config or text containing NUL bytes; never returns a partial report.
VerificationReport verify(const std::string& raw_ocr_text,
                          const ReferenceRecord& reference,
                          const CanonicalDate& as_of = today(),
                          const VerifyConfig& cfg = {});

// Same, over several OCR passes of one document (each field from the first
// pass that yields it).
VerificationReport verify_passes(const std::vector<std::string>& raw_ocr_texts,
                                 const ReferenceRecord& reference,
                                 const CanonicalDate& as_of = today(),
                                 const VerifyConfig& cfg = {});

}  // namespace verify
