#include "verify/VerifyConfig.hpp"
#include "verify/Errors.hpp"
#include "text/TextUtil.hpp"

namespace verify {

TeenPolicy parse_teen_policy(const std::string& s) {
    const std::string k = textutil::to_lower_ascii(textutil::trim(s));
    if (k == "band" || k == "13-19") return TeenPolicy::Band;
    if (k == "under18" || k == "under_18" || k == "minor") return TeenPolicy::Under18;
    throw InvalidInputError("unknown teen policy: '" + s + "' (expected band|under18)");
}

const char* teen_policy_name(TeenPolicy p) {
    return p == TeenPolicy::Under18 ? "under18" : "band";
}

void validate_config(const VerifyConfig& cfg) {
    if (!(cfg.name_threshold >= 0.0 && cfg.name_threshold <= 1.0)) {
        throw InvalidInputError("name_threshold must be in [0,1], got " + std::to_string(cfg.name_threshold));
    }
    if (cfg.max_name_length < 4) {
        throw InvalidInputError("max_name_length must be at least 4");
    }
}

}  // namespace verify
