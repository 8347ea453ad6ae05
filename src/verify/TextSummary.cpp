#include "verify/TextSummary.hpp"
#include "extract/IdFormat.hpp"

#include <iomanip>
#include <sstream>

namespace verify {

static const char* yes_no(bool b) {
    return b ? "Yes" : "No";
}

static std::string or_not_found(const std::optional<std::string>& v) {
    return v ? *v : "Not found";
}

static std::string extracted_block(const extract::ExtractedFields& f) {
    std::ostringstream os;
    os << "Name: " << or_not_found(f.name) << "\n";
    os << "DOB: " << (f.dob ? f.dob->to_string() : "Not found") << "\n";
    os << "Aadhaar: " << (f.id_number ? idformat::group_digits(*f.id_number) : "Not found") << "\n";
    return os.str();
}

std::string render_text_summary(const VerificationReport& report) {
    std::ostringstream os;

    os << "Verification Results:\n";
    os << "All details match: " << yes_no(report.all_match()) << "\n";
    os << "Name matches: " << yes_no(report.name().matched) << " (" << or_not_found(report.name().extracted_value)
       << ", similarity " << std::fixed << std::setprecision(2) << report.name().similarity << ")\n";
    os << "DOB matches: " << yes_no(report.dob().matched) << " (" << or_not_found(report.dob().extracted_value)
       << ")\n";
    os << "Aadhaar matches: " << yes_no(report.id().matched) << " (" << or_not_found(report.id().extracted_value)
       << ")\n";

    os << "\nExtracted Details:\n";
    os << extracted_block(report.extracted());

    if (report.age_years()) {
        os << "Age: " << *report.age_years() << " (" << (report.is_teen().value_or(false) ? "Teen" : "Not teen")
           << ")\n";
    }

    return os.str();
}

std::string render_extracted(const extract::ExtractedFields& fields) {
    std::ostringstream os;
    os << extracted_block(fields);

    auto rule_line = [&](const char* field, const std::string& rule) {
        os << "  " << field << " <- " << (rule.empty() ? "(none)" : rule) << "\n";
    };
    os << "Rules:\n";
    rule_line("name", fields.name_rule);
    rule_line("dob", fields.dob_rule);
    rule_line("aadhaar", fields.id_rule);

    return os.str();
}

}  // namespace verify
