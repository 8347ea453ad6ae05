#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "verify/CanonicalDate.hpp"

namespace extract {

// half-open byte range [begin, end) in the normalized text
struct Span {
    size_t begin = 0;
    size_t end = 0;
};

struct Candidate {
    std::string value;
    Span span;
};

// Text ranges already assigned to a field. Earlier extractors claim first.
class SpanClaims {
public:
    void claim(const std::string& field, const Span& span);

    bool overlaps(const Span& span) const;

    // true if a span owned by `field` touches `span`, or is separated from it
    // only by characters in `separators`
    bool adjacent_to(const std::string& field, const Span& span, const std::string& text,
                     const std::string& separators) const;

    const std::vector<std::pair<std::string, Span>>& all() const { return claims_; }

private:
    std::vector<std::pair<std::string, Span>> claims_;
};

struct RuleContext {
    const std::string& text;
    const SpanClaims& claims;
    const verify::CanonicalDate& as_of;
};

// all candidates of one rule, in preference order
using CandidateFinder = std::function<std::vector<Candidate>(const std::string& text)>;

// pure clean/accept step; nullopt rejects the candidate
using CandidateAccept = std::function<std::optional<std::string>(const Candidate&, const RuleContext&)>;

// what a rejected candidate means for the rest of the cascade
enum class OnReject {
    NextCandidate,  // keep scanning this rule's matches
    NextRule,       // only the rule's first match counts
    StopCascade     // a match of this rule decides the field, accepted or not
};

struct FieldRule {
    std::string name;
    CandidateFinder find;
    CandidateAccept accept;
    OnReject on_reject = OnReject::NextCandidate;
};

struct CascadeHit {
    std::string value;
    Span span;
    std::string rule;
};

// Candidates from capture group 1 of every non-overlapping match, in text order.
CandidateFinder regex_finder(const std::string& pattern, bool icase);

FieldRule regex_rule(const std::string& name, const std::string& pattern, bool icase, CandidateAccept accept,
                     OnReject on_reject = OnReject::NextCandidate);

// Rules are tried in order; the first accepted candidate wins and its span is
// claimed for `field`. Candidates overlapping an existing claim are skipped.
// A rejected candidate is handled by the rule's OnReject.
std::optional<CascadeHit> run_cascade(const std::vector<FieldRule>& rules,
                                      const std::string& field,
                                      const std::string& text,
                                      SpanClaims& claims,
                                      const verify::CanonicalDate& as_of);

}  // namespace extract
