#include "commands/verify.hpp"
#include "commands/CliArgs.hpp"

#include "io/JsonIO.hpp"
#include "text/TextUtil.hpp"
#include "verify/Errors.hpp"
#include "verify/ReportArtifact.hpp"
#include "verify/TextSummary.hpp"
#include "verify/Verifier.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cli::get_arg;
using cli::has_flag;

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    fs::path p(out_path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) return false;
    out.open(p, std::ios::out | std::ios::trunc);
    return (bool)out;
}

static bool parse_double(const std::string& s, double& out) {
    try {
        size_t used = 0;
        out = std::stod(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int print_verify_help() {
    std::cerr
        << "usage:\n"
        << "  idcheck verify --reference <json> (--text <txt> | --image <img>) [options]\n"
        << "\n"
        << "inputs:\n"
        << "  --reference <path>           expected values: {\"name\", \"dob\", \"id_number\"}\n"
        << "  --text <path>                OCR text produced elsewhere\n"
        << "  --image <path>               card image, read with tesseract\n"
        << "  --as_of <date>               default: today\n"
        << "\n"
        << "matching:\n"
        << "  --config <path>              JSON config file\n"
        << "  --name_threshold <f>         default: 0.80\n"
        << "  --teen_policy <band|under18> default: band (13-19)\n"
        << "  --strict_id                  require Aadhaar leading digit + Verhoeff check\n"
        << "\n"
        << "outputs:\n"
        << "  --json <path>                write the report as JSON\n"
        << "  --out <path>                 mirror console output to a file\n"
        << "  --show_text                  print the normalized OCR text\n";
    return 0;
}

static int verify_usage() {
    std::cerr
        << "usage:\n"
        << "  idcheck verify --reference <json> (--text <txt> | --image <img>) [options]\n"
        << "  idcheck verify --help\n";
    return 1;
}

int cmd_verify(int argc, char** argv) {
    const std::string reference_path = get_arg(argc, argv, "--reference", "");
    const std::string config_path    = get_arg(argc, argv, "--config", "");
    const std::string json_path      = get_arg(argc, argv, "--json", "");
    const std::string out_path       = get_arg(argc, argv, "--out", "");
    const bool show_text             = has_flag(argc, argv, "--show_text");

    if (reference_path.empty()) {
        std::cerr << "error: missing --reference\n";
        return verify_usage();
    }

    try {
        verify::VerifyConfig cfg;
        if (!config_path.empty()) cfg = loadVerifyConfig(config_path, cfg);

        const std::string thr = get_arg(argc, argv, "--name_threshold", "");
        if (!thr.empty() && !parse_double(thr, cfg.name_threshold)) {
            std::cerr << "error: invalid --name_threshold\n";
            return 1;
        }
        const std::string policy = get_arg(argc, argv, "--teen_policy", "");
        if (!policy.empty()) cfg.teen_policy = verify::parse_teen_policy(policy);
        if (has_flag(argc, argv, "--strict_id")) cfg.strict_id_format = true;
        verify::validate_config(cfg);

        const verify::CanonicalDate as_of = cli::get_as_of(argc, argv);
        const verify::ReferenceRecord ref = loadReferenceRecord(reference_path);

        std::vector<std::string> passes;
        std::string source_path;
        if (!cli::read_ocr_passes(argc, argv, passes, source_path)) return verify_usage();

        const verify::VerificationReport report = verify::verify_passes(passes, ref, as_of, cfg);

        std::ofstream out;
        const bool write_out = open_out(out, out_path);
        if (!out_path.empty() && !write_out) {
            std::cerr << "error: failed to open --out path: " << out_path << "\n";
            return 1;
        }

        Printer pr;
        pr.a = &std::cout;
        pr.b = write_out ? (std::ostream*)&out : nullptr;

        if (show_text) {
            for (size_t i = 0; i < passes.size(); ++i) {
                pr << "--- OCR pass " << (i + 1) << " ---\n" << textutil::normalize_ocr(passes[i]) << "\n";
            }
            pr << "----------------\n";
        }

        pr << "As of: " << as_of.to_iso() << " (teen policy: " << verify::teen_policy_name(cfg.teen_policy) << ")\n";
        pr << verify::render_text_summary(report);

        if (!json_path.empty()) {
            verify::ReportArtifact art;
            art.reference_path = reference_path;
            art.ocr_source = source_path;
            art.teen_policy = verify::teen_policy_name(cfg.teen_policy);
            art.report = &report;
            art.write_to(fs::path(json_path));
            pr << "\nWROTE: " << json_path << "\n";
        }

        return report.all_match() ? 0 : 2;
    } catch (const verify::InvalidInputError& e) {
        std::cerr << "error: invalid input: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
