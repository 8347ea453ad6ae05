#pragma once
#include <optional>
#include <string>
#include <vector>

#include "extract/FieldRule.hpp"
#include "verify/CanonicalDate.hpp"
#include "verify/VerifyConfig.hpp"

namespace extract {

struct ExtractedFields {
    std::optional<std::string> name;
    std::optional<verify::CanonicalDate> dob;
    std::optional<std::string> dob_text;   // date string as it appeared on the document
    std::optional<std::string> id_number;  // digits only

    // which rule produced each field (empty when absent)
    std::string name_rule;
    std::string dob_rule;
    std::string id_rule;
};

class FieldExtractor {
public:
    explicit FieldExtractor(const verify::VerifyConfig& cfg = {});

    // One OCR pass. Runs the text normalizer, then Name -> DOB -> ID over a
    // shared set of span claims.
    ExtractedFields extract(const std::string& raw_text, const verify::CanonicalDate& as_of) const;

    // Several OCR passes of the same document; each field comes from the
    // first pass that yields it.
    ExtractedFields extract_passes(const std::vector<std::string>& raw_texts,
                                   const verify::CanonicalDate& as_of) const;

    const std::vector<FieldRule>& name_rules() const { return name_rules_; }
    const std::vector<FieldRule>& dob_rules() const { return dob_rules_; }
    const std::vector<FieldRule>& id_rules() const { return id_rules_; }

private:
    verify::VerifyConfig cfg_;
    std::vector<FieldRule> name_rules_;
    std::vector<FieldRule> dob_rules_;
    std::vector<FieldRule> id_rules_;
};

}  // namespace extract
