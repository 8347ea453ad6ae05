#pragma once

#include <optional>
#include <string>

#include "extract/FieldExtractor.hpp"
#include "verify/CanonicalDate.hpp"
#include "verify/MatchEngine.hpp"
#include "verify/VerifyConfig.hpp"

namespace verify {

struct ReferenceRecord {
    std::string name;
    std::string dob;        // free-form date
    std::string id_number;  // free-form, separators allowed
};

// Built once per run by build_report(); read-only afterwards.
class VerificationReport {
public:
    VerificationReport(extract::ExtractedFields fields,
                       FieldMatch name,
                       FieldMatch dob,
                       FieldMatch id,
                       std::optional<int> age_years,
                       std::optional<bool> is_teen,
                       CanonicalDate as_of);

    const FieldMatch& name() const { return name_; }
    const FieldMatch& dob() const { return dob_; }
    const FieldMatch& id() const { return id_; }

    bool all_match() const { return all_match_; }

    const std::optional<int>& age_years() const { return age_years_; }
    const std::optional<bool>& is_teen() const { return is_teen_; }

    const extract::ExtractedFields& extracted() const { return fields_; }
    const CanonicalDate& as_of() const { return as_of_; }

private:
    extract::ExtractedFields fields_;
    FieldMatch name_;
    FieldMatch dob_;
    FieldMatch id_;
    bool all_match_ = false;
    std::optional<int> age_years_;
    std::optional<bool> is_teen_;
    CanonicalDate as_of_;
};

// Aggregates the three matches; age and teen flag come from the extracted
// (document) DOB, never the reference DOB.
VerificationReport build_report(const extract::ExtractedFields& fields,
                                const FieldMatch& name,
                                const FieldMatch& dob,
                                const FieldMatch& id,
                                const CanonicalDate& as_of,
                                TeenPolicy policy);

}  // namespace verify
