#include "verify/Report.hpp"
#include "verify/AgeCalculator.hpp"

#include <utility>

namespace verify {

VerificationReport::VerificationReport(extract::ExtractedFields fields,
                                       FieldMatch name,
                                       FieldMatch dob,
                                       FieldMatch id,
                                       std::optional<int> age_years,
                                       std::optional<bool> is_teen,
                                       CanonicalDate as_of)
    : fields_(std::move(fields)),
      name_(std::move(name)),
      dob_(std::move(dob)),
      id_(std::move(id)),
      all_match_(name_.matched && dob_.matched && id_.matched),
      age_years_(age_years),
      is_teen_(is_teen),
      as_of_(as_of) {}

VerificationReport build_report(const extract::ExtractedFields& fields,
                                const FieldMatch& name,
                                const FieldMatch& dob,
                                const FieldMatch& id,
                                const CanonicalDate& as_of,
                                TeenPolicy policy) {
    std::optional<int> age;
    std::optional<bool> teen;

    if (fields.dob) {
        age = compute_age(*fields.dob, as_of);
        teen = is_teen(*age, policy);
    }

    return VerificationReport(fields, name, dob, id, age, teen, as_of);
}

}  // namespace verify
