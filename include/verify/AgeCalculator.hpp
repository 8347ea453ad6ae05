#pragma once

#include "verify/CanonicalDate.hpp"
#include "verify/VerifyConfig.hpp"

namespace verify {

// Whole years from dob to as_of. Throws InvalidDateError if as_of < dob.
int compute_age(const CanonicalDate& dob, const CanonicalDate& as_of);

bool is_teen(int age_years, TeenPolicy policy = kDefaultTeenPolicy);

}  // namespace verify
