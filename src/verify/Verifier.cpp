#include "verify/Verifier.hpp"
#include "verify/Errors.hpp"
#include "verify/MatchEngine.hpp"
#include "extract/FieldExtractor.hpp"

namespace verify {

static void require_text(const std::string& text) {
    if (text.find('\0') != std::string::npos) {
        throw InvalidInputError("OCR text contains NUL bytes");
    }
}

VerificationReport verify_passes(const std::vector<std::string>& raw_ocr_texts,
                                 const ReferenceRecord& reference,
                                 const CanonicalDate& as_of,
                                 const VerifyConfig& cfg) {
    validate_config(cfg);
    for (const auto& t : raw_ocr_texts) require_text(t);

    const extract::FieldExtractor extractor(cfg);
    const extract::ExtractedFields fields = extractor.extract_passes(raw_ocr_texts, as_of);

    // independent comparisons, no short-circuit
    const FieldMatch name = match_name(fields.name, reference.name, cfg.name_threshold);
    const FieldMatch dob = match_dob(fields.dob_text, reference.dob, as_of.year());
    const FieldMatch id = match_id(fields.id_number, reference.id_number);

    return build_report(fields, name, dob, id, as_of, cfg.teen_policy);
}

VerificationReport verify(const std::string& raw_ocr_text,
                          const ReferenceRecord& reference,
                          const CanonicalDate& as_of,
                          const VerifyConfig& cfg) {
    return verify_passes(std::vector<std::string>{raw_ocr_text}, reference, as_of, cfg);
}

}  // namespace verify
