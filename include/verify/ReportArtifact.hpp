// include/verify/ReportArtifact.hpp
#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "verify/Report.hpp"

namespace verify {

struct ReportArtifact {
    std::string reference_path;
    std::string ocr_source;   // text file or image the OCR text came from
    std::string teen_policy;

    const VerificationReport* report = nullptr;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

nlohmann::json field_match_to_json(const FieldMatch& m);

}  // namespace verify
