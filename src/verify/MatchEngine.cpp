#include "verify/MatchEngine.hpp"
#include "verify/Similarity.hpp"
#include "extract/IdFormat.hpp"

namespace verify {

FieldMatch match_name(const std::optional<std::string>& extracted, const std::string& expected, double threshold) {
    FieldMatch m;
    m.extracted_value = extracted;
    m.expected_value = expected;

    if (!extracted) return m;
    if (normalize_name(*extracted).empty() || normalize_name(expected).empty()) return m;

    m.similarity = name_similarity(*extracted, expected);
    m.matched = m.similarity >= threshold;
    return m;
}

FieldMatch match_dob(const std::optional<std::string>& extracted_text, const std::string& expected, int max_year) {
    FieldMatch m;
    m.expected_value = expected;

    if (!extracted_text) return m;

    const auto found = try_parse_date(*extracted_text, max_year);
    m.extracted_value = found ? found->to_string() : *extracted_text;

    const auto want = try_parse_date(expected, max_year);
    if (!found || !want) return m;

    m.matched = (*found == *want);
    m.similarity = m.matched ? 1.0 : 0.0;
    return m;
}

FieldMatch match_id(const std::optional<std::string>& extracted, const std::string& expected) {
    FieldMatch m;
    m.extracted_value = extracted;
    m.expected_value = expected;

    if (!extracted) return m;

    const std::string a = idformat::digits_only(*extracted);
    const std::string b = idformat::digits_only(expected);
    if (!idformat::is_well_formed(a) || !idformat::is_well_formed(b)) return m;

    m.matched = (a == b);
    m.similarity = m.matched ? 1.0 : 0.0;
    return m;
}

}  // namespace verify
