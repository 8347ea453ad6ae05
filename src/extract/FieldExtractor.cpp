#include "extract/FieldExtractor.hpp"
#include "extract/IdFormat.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace extract {

// Devanagari labels as UTF-8 bytes
static const std::string kLabelNaam = "\xE0\xA4\xA8\xE0\xA4\xBE\xE0\xA4\xAE";  // नाम
static const std::string kLabelJanmTithi =
    "\xE0\xA4\x9C\xE0\xA4\xA8\xE0\xA5\x8D\xE0\xA4\xAE \xE0\xA4\xA4\xE0\xA4\xBF\xE0\xA4\xA5\xE0\xA4\xBF";  // जन्म तिथि
static const std::string kLabelAadhaar = "\xE0\xA4\x86\xE0\xA4\xA7\xE0\xA4\xBE\xE0\xA4\xB0";  // आधार

static const std::string kMonth = R"((?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\.?)";

static const std::string kDateShape =
    R"((?:\d{1,2}[/\-]\d{1,2}[/\-]\d{4})"
    R"(|\d{4}[/\-]\d{1,2}[/\-]\d{1,2})"
    R"(|\d{1,2}[ /\-]+)" + kMonth + R"([ /\-,]+\d{4})"
    R"(|)" + kMonth + R"([ \-]+\d{1,2}(?:st|nd|rd|th)?(?:, *| +)\d{4})"
    R"(|\d{1,2} \d{1,2} \d{4})"
    R"(|\d{4} \d{1,2} \d{1,2}))";

static const std::string kIdShape = R"(\d{4}[ \-]?\d{4}[ \-]?\d{4})";

static const std::string kNameValue = R"(([A-Za-z][A-Za-z.'\-]*(?:[ ]+[A-Za-z][A-Za-z.'\-]*)*))";

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// a digit right before pos, or right before a single separator at pos-1
static bool preceded_by_digit_group(const std::string& text, size_t pos) {
    if (pos >= 1 && is_digit(text[pos - 1])) return true;
    if (pos >= 2 && (text[pos - 1] == ' ' || text[pos - 1] == '-') && is_digit(text[pos - 2])) return true;
    return false;
}

static std::string strip_token_punct(const std::string& t) {
    size_t a = 0, b = t.size();
    while (a < b && !is_alpha(t[a])) ++a;
    while (b > a && !is_alpha(t[b - 1])) --b;
    return t.substr(a, b - a);
}

// words that end a name value when OCR glues the next field onto the same line
static const std::unordered_set<std::string>& trailing_labels() {
    static const std::unordered_set<std::string> s = {
        "DOB", "D.O.B", "DATE", "BIRTH", "YOB", "YEAR", "GENDER", "SEX", "MALE", "FEMALE",
        "AADHAAR", "AADHAR", "UID", "VID", "ADDRESS", "FATHER", "HUSBAND", "MOTHER"
    };
    return s;
}

// printed card furniture that is never part of a holder's name
static const std::unordered_set<std::string>& boilerplate_words() {
    static const std::unordered_set<std::string> s = {
        "GOVERNMENT", "GOVT", "INDIA", "UNIQUE", "IDENTIFICATION", "AUTHORITY", "OF",
        "MALE", "FEMALE", "GENDER", "DOB", "DATE", "BIRTH", "YEAR", "ADDRESS",
        "AADHAAR", "AADHAR", "ENROLMENT", "ENROLLMENT", "NUMBER", "NO", "VID", "UID",
        "ISSUE", "DOWNLOAD", "HELP", "WWW", "MERA", "PEHCHAAN", "FATHER", "HUSBAND",
        "CARD", "SIGNATURE", "VALID", "PROOF", "IDENTITY", "CITIZENSHIP", "NOT", "THE",
        "ESTABLISH", "AUTHENTICATE", "ONLINE"
    };
    return s;
}

static std::optional<std::string> clean_name(const std::string& raw, size_t max_len) {
    std::vector<std::string> kept;
    for (const auto& tok : textutil::tokenize_words(raw)) {
        const std::string bare = textutil::to_upper_ascii(strip_token_punct(tok));
        if (trailing_labels().count(bare) || trailing_labels().count(textutil::to_upper_ascii(tok))) break;
        if (bare.empty()) continue;
        kept.push_back(tok);
    }
    if (kept.empty()) return std::nullopt;

    kept.front() = kept.front().substr(kept.front().find_first_not_of(".'-"));
    while (!kept.back().empty() && !is_alpha(kept.back().back())) kept.back().pop_back();

    bool all_boilerplate = true;
    std::string out;
    for (const auto& t : kept) {
        if (!boilerplate_words().count(textutil::to_upper_ascii(strip_token_punct(t)))) all_boilerplate = false;
        if (!out.empty()) out += ' ';
        out += t;
    }

    size_t letters = 0;
    for (char c : out) if (is_alpha(c)) ++letters;

    if (all_boilerplate || letters < 2 || out.size() > max_len) return std::nullopt;
    return out;
}

static bool any_rule_matches(const std::vector<FieldRule>& rules, const std::string& line) {
    for (const auto& r : rules) {
        if (!r.find(line).empty()) return true;
    }
    return false;
}

// Fallback: lines made mostly of alphabetic tokens, best letter density first.
static std::vector<Candidate> name_like_lines(const std::string& text, size_t max_len,
                                              const std::vector<FieldRule>& dob_rules,
                                              const std::vector<FieldRule>& id_rules) {
    struct Scored {
        double score;
        size_t order;
        Candidate cand;
    };
    std::vector<Scored> scored;

    size_t offset = 0;
    size_t order = 0;
    for (const auto& line : textutil::split_lines(text)) {
        const size_t line_begin = offset;
        offset += line.size() + 1;

        if (line.size() < 4) continue;
        if (std::any_of(line.begin(), line.end(), is_digit)) continue;
        if (any_rule_matches(dob_rules, line) || any_rule_matches(id_rules, line)) continue;

        const auto tokens = textutil::tokenize_words(line);
        std::vector<std::string> alpha_tokens;
        bool boilerplate = false;
        for (const auto& t : tokens) {
            const std::string bare = strip_token_punct(t);
            if (boilerplate_words().count(textutil::to_upper_ascii(bare))) boilerplate = true;
            bool alpha = !bare.empty();
            for (char c : t) {
                if (!is_alpha(c) && c != '.' && c != '\'' && c != '-') alpha = false;
            }
            if (alpha) alpha_tokens.push_back(t);
        }
        if (boilerplate || alpha_tokens.size() < 2) continue;
        if (alpha_tokens.size() * 4 < tokens.size() * 3) continue;  // under 75% alphabetic

        std::string value;
        size_t letters = 0;
        for (const auto& t : alpha_tokens) {
            if (!value.empty()) value += ' ';
            value += t;
        }
        for (char c : line) if (is_alpha(c)) ++letters;
        if (value.size() < 4 || value.size() > max_len) continue;

        Candidate c;
        c.value = value;
        c.span = Span{line_begin, line_begin + line.size()};
        scored.push_back(Scored{static_cast<double>(letters) / static_cast<double>(line.size()), order++, c});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        return a.score > b.score;
    });

    std::vector<Candidate> out;
    out.reserve(scored.size());
    for (auto& s : scored) out.push_back(std::move(s.cand));
    return out;
}

static std::vector<FieldRule> make_dob_rules() {
    auto accept_date = [](const Candidate& c, const RuleContext& ctx) -> std::optional<std::string> {
        const std::string v = textutil::trim(c.value);
        auto d = verify::try_parse_date(v, ctx.as_of.year());
        if (!d || ctx.as_of < *d) return std::nullopt;
        return v;
    };

    auto accept_spaced = [accept_date](const Candidate& c, const RuleContext& ctx) -> std::optional<std::string> {
        if (preceded_by_digit_group(ctx.text, c.span.begin)) return std::nullopt;
        return accept_date(c, ctx);
    };

    // A labeled date decides the field even when it fails to normalize; each
    // bare rule only gets its first match.
    std::vector<FieldRule> rules;
    rules.push_back(regex_rule(
        "dob_labeled",
        R"((?:date of birth|birth date|d\.o\.b\.?|dob|birth|)" + kLabelJanmTithi + R"()[ ]*[:\-/]?[ ]*()" +
            kDateShape + R"()(?!\d))",
        true, accept_date, OnReject::StopCascade));
    rules.push_back(regex_rule("dob_day_first", R"((?:^|[^\d])(\d{1,2}[/\-]\d{1,2}[/\-]\d{4})(?!\d))", false,
                               accept_date, OnReject::NextRule));
    rules.push_back(regex_rule("dob_year_first", R"((?:^|[^\d])(\d{4}[/\-]\d{1,2}[/\-]\d{1,2})(?!\d))", false,
                               accept_date, OnReject::NextRule));
    rules.push_back(regex_rule("dob_day_month_name",
                               R"((?:^|[^\dA-Za-z])(\d{1,2}[ /\-]+)" + kMonth + R"([ /\-,]+\d{4})(?!\d))", true,
                               accept_date, OnReject::NextRule));
    rules.push_back(regex_rule(
        "dob_month_name_day",
        R"((?:^|[^A-Za-z])()" + kMonth + R"([ \-]+\d{1,2}(?:st|nd|rd|th)?(?:, *| +)\d{4})(?!\d))", true,
        accept_date, OnReject::NextRule));
    rules.push_back(regex_rule("dob_spaced", R"((?:^|[^\d])(\d{1,2} \d{1,2} \d{4})(?![ \-]?\d))", false,
                               accept_spaced, OnReject::NextRule));
    rules.push_back(regex_rule("dob_year_spaced", R"((?:^|[^\d])(\d{4} \d{1,2} \d{1,2})(?![ \-]?\d))", false,
                               accept_spaced, OnReject::NextRule));
    return rules;
}

static std::vector<FieldRule> make_id_rules(bool strict) {
    auto accept_id = [strict](const Candidate& c, const RuleContext& ctx) -> std::optional<std::string> {
        const std::string digits = idformat::digits_only(c.value);
        if (!idformat::is_well_formed(digits)) return std::nullopt;
        if (preceded_by_digit_group(ctx.text, c.span.begin)) return std::nullopt;
        // never reuse digits next to the year the DOB extractor took
        if (ctx.claims.adjacent_to("dob", c.span, ctx.text, " -")) return std::nullopt;
        if (strict && !idformat::passes_aadhaar_rules(digits)) return std::nullopt;
        return digits;
    };

    std::vector<FieldRule> rules;
    rules.push_back(regex_rule(
        "id_labeled",
        R"((?:aadhaar|aadhar|uid|)" + kLabelAadhaar + R"()[ ]*(?:number|no\.?)?[ ]*[:\-]?[ ]*()" + kIdShape +
            R"()(?![ \-]?\d))",
        true, accept_id));
    rules.push_back(regex_rule("id_bare", R"((?:^|[^\d])()" + kIdShape + R"()(?![ \-]?\d))", false, accept_id));
    return rules;
}

static std::vector<FieldRule> make_name_rules(size_t max_len,
                                              const std::vector<FieldRule>& dob_rules,
                                              const std::vector<FieldRule>& id_rules) {
    auto accept_name = [max_len](const Candidate& c, const RuleContext&) -> std::optional<std::string> {
        return clean_name(c.value, max_len);
    };

    std::vector<FieldRule> rules;
    rules.push_back(regex_rule(
        "name_labeled",
        R"((?:^|\n)[ ]*(?:)" + kLabelNaam + R"([ ]*/[ ]*)?(?:name|)" + kLabelNaam +
            R"()(?:[ ]*[:\-][ ]*|[ ]+))" + kNameValue,
        true, accept_name));
    // Aadhaar letter: "To" on a line of its own, addressee on the next
    rules.push_back(regex_rule("name_to",
                               R"((?:^|\n)(?:To|TO)[ ]*[,:]?\n)"
                               R"((?:(?:Mrs|Mr|Ms|Shri|Smt|Kumari|Km|MRS|MR|MS|SHRI|SMT|KUMARI|KM)\.?[ ]+)?)" +
                                   kNameValue,
                               false, accept_name));
    rules.push_back(regex_rule("name_honorific",
                               R"((?:^|[^A-Za-z])(?:mrs|mr|ms|shri|smt|kumari|km)\.?[ ]+)" + kNameValue, true,
                               accept_name));
    rules.push_back(regex_rule("name_capitalized_line",
                               R"((?:^|\n)([A-Z][a-z]+(?:[ ]+[A-Z][a-z]+)+)[ ]*(?=\n|$))", false, accept_name));

    FieldRule heuristic;
    heuristic.name = "name_heuristic";
    heuristic.find = [max_len, dob_rules, id_rules](const std::string& text) {
        return name_like_lines(text, max_len, dob_rules, id_rules);
    };
    heuristic.accept = accept_name;
    rules.push_back(std::move(heuristic));
    return rules;
}

FieldExtractor::FieldExtractor(const verify::VerifyConfig& cfg)
    : cfg_(cfg),
      dob_rules_(make_dob_rules()),
      id_rules_(make_id_rules(cfg.strict_id_format)) {
    name_rules_ = make_name_rules(cfg_.max_name_length, dob_rules_, id_rules_);
}

ExtractedFields FieldExtractor::extract(const std::string& raw_text, const verify::CanonicalDate& as_of) const {
    const std::string text = textutil::normalize_ocr(raw_text);

    ExtractedFields out;
    SpanClaims claims;

    if (auto hit = run_cascade(name_rules_, "name", text, claims, as_of)) {
        out.name = hit->value;
        out.name_rule = hit->rule;
    }

    if (auto hit = run_cascade(dob_rules_, "dob", text, claims, as_of)) {
        if (auto d = verify::try_parse_date(hit->value, as_of.year())) {
            out.dob = *d;
            out.dob_text = hit->value;
            out.dob_rule = hit->rule;
        }
    }

    if (auto hit = run_cascade(id_rules_, "id", text, claims, as_of)) {
        out.id_number = hit->value;
        out.id_rule = hit->rule;
    }

    return out;
}

ExtractedFields FieldExtractor::extract_passes(const std::vector<std::string>& raw_texts,
                                               const verify::CanonicalDate& as_of) const {
    ExtractedFields out;

    for (const auto& text : raw_texts) {
        if (out.name && out.dob && out.id_number) break;

        ExtractedFields pass = extract(text, as_of);
        if (!out.name && pass.name) {
            out.name = pass.name;
            out.name_rule = pass.name_rule;
        }
        if (!out.dob && pass.dob) {
            out.dob = pass.dob;
            out.dob_text = pass.dob_text;
            out.dob_rule = pass.dob_rule;
        }
        if (!out.id_number && pass.id_number) {
            out.id_number = pass.id_number;
            out.id_rule = pass.id_rule;
        }
    }

    return out;
}

}  // namespace extract
