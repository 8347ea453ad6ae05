#include "verify/ReportArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace verify {

template <typename T>
static nlohmann::json opt_to_json(const std::optional<T>& v) {
    if (!v) return nullptr;
    return *v;
}

nlohmann::json field_match_to_json(const FieldMatch& m) {
    nlohmann::json j;
    j["matched"] = m.matched;
    j["similarity"] = m.similarity;
    j["extracted"] = opt_to_json(m.extracted_value);
    j["expected"] = m.expected_value;
    return j;
}

nlohmann::json ReportArtifact::to_json() const {
    if (!report) throw std::runtime_error("ReportArtifact: no report attached");
    const VerificationReport& r = *report;
    const extract::ExtractedFields& f = r.extracted();

    nlohmann::json j;
    j["reference_path"] = reference_path;
    j["ocr_source"] = ocr_source;
    j["as_of"] = r.as_of().to_iso();
    j["teen_policy"] = teen_policy;

    j["all_match"] = r.all_match();
    j["name"] = field_match_to_json(r.name());
    j["dob"] = field_match_to_json(r.dob());
    j["id_number"] = field_match_to_json(r.id());

    j["age"] = opt_to_json(r.age_years());
    j["is_teen"] = opt_to_json(r.is_teen());

    j["extracted"] = {
        {"name", opt_to_json(f.name)},
        {"dob", f.dob ? nlohmann::json(f.dob->to_iso()) : nlohmann::json(nullptr)},
        {"dob_text", opt_to_json(f.dob_text)},
        {"id_number", opt_to_json(f.id_number)},
        {"rules", {
            {"name", f.name_rule},
            {"dob", f.dob_rule},
            {"id_number", f.id_rule},
        }},
    };

    return j;
}

void ReportArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace verify
