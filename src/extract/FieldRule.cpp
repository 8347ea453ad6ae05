#include "extract/FieldRule.hpp"

#include <memory>
#include <utility>

namespace extract {

void SpanClaims::claim(const std::string& field, const Span& span) {
    claims_.emplace_back(field, span);
}

bool SpanClaims::overlaps(const Span& span) const {
    for (const auto& c : claims_) {
        if (span.begin < c.second.end && c.second.begin < span.end) return true;
    }
    return false;
}

bool SpanClaims::adjacent_to(const std::string& field, const Span& span, const std::string& text,
                             const std::string& separators) const {
    auto only_separators = [&](size_t a, size_t b) {
        for (size_t i = a; i < b && i < text.size(); ++i) {
            if (separators.find(text[i]) == std::string::npos) return false;
        }
        return true;
    };

    for (const auto& c : claims_) {
        if (c.first != field) continue;
        const Span& o = c.second;
        if (span.begin < o.end && o.begin < span.end) return true;
        if (o.end <= span.begin && only_separators(o.end, span.begin)) return true;
        if (span.end <= o.begin && only_separators(span.end, o.begin)) return true;
    }
    return false;
}

CandidateFinder regex_finder(const std::string& pattern, bool icase) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    auto re = std::make_shared<const std::regex>(pattern, flags);

    return [re](const std::string& text) {
        std::vector<Candidate> out;
        auto it = std::sregex_iterator(text.begin(), text.end(), *re);
        auto end = std::sregex_iterator();
        for (; it != end; ++it) {
            const std::smatch& m = *it;
            if (!m[1].matched) continue;
            Candidate c;
            c.value = m[1].str();
            c.span.begin = static_cast<size_t>(m.position(1));
            c.span.end = c.span.begin + static_cast<size_t>(m.length(1));
            out.push_back(std::move(c));
        }
        return out;
    };
}

FieldRule regex_rule(const std::string& name, const std::string& pattern, bool icase, CandidateAccept accept,
                     OnReject on_reject) {
    FieldRule r;
    r.name = name;
    r.find = regex_finder(pattern, icase);
    r.accept = std::move(accept);
    r.on_reject = on_reject;
    return r;
}

std::optional<CascadeHit> run_cascade(const std::vector<FieldRule>& rules,
                                      const std::string& field,
                                      const std::string& text,
                                      SpanClaims& claims,
                                      const verify::CanonicalDate& as_of) {
    const RuleContext ctx{text, claims, as_of};

    for (const auto& rule : rules) {
        for (const auto& cand : rule.find(text)) {
            if (claims.overlaps(cand.span)) continue;

            std::optional<std::string> value = rule.accept(cand, ctx);
            if (!value) {
                if (rule.on_reject == OnReject::StopCascade) return std::nullopt;
                if (rule.on_reject == OnReject::NextRule) break;
                continue;
            }

            claims.claim(field, cand.span);
            return CascadeHit{*value, cand.span, rule.name};
        }
    }
    return std::nullopt;
}

}  // namespace extract
