#include "verify/AgeCalculator.hpp"
#include "verify/Errors.hpp"

namespace verify {

int compute_age(const CanonicalDate& dob, const CanonicalDate& as_of) {
    if (as_of < dob) {
        throw InvalidDateError("as-of date " + as_of.to_iso() + " precedes date of birth " + dob.to_iso());
    }

    int years = as_of.year() - dob.year();
    if (as_of.month() < dob.month() || (as_of.month() == dob.month() && as_of.day() < dob.day())) {
        --years;
    }
    return years;
}

bool is_teen(int age_years, TeenPolicy policy) {
    switch (policy) {
        case TeenPolicy::Under18:
            return age_years < kMinorAgeLimit;
        case TeenPolicy::Band:
            break;
    }
    return age_years >= kTeenMinAge && age_years <= kTeenMaxAge;
}

}  // namespace verify
