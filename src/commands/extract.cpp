#include "commands/extract.hpp"
#include "commands/CliArgs.hpp"

#include "extract/FieldExtractor.hpp"
#include "verify/TextSummary.hpp"

#include <iostream>
#include <string>
#include <vector>

int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  idcheck extract (--text <txt> | --image <img>) [options]\n"
        << "\n"
        << "options:\n"
        << "  --as_of <date>               default: today (later DOBs are rejected)\n"
        << "  --strict_id                  require Aadhaar leading digit + Verhoeff check\n";
    return 0;
}

int cmd_extract(int argc, char** argv) {
    try {
        verify::VerifyConfig cfg;
        if (cli::has_flag(argc, argv, "--strict_id")) cfg.strict_id_format = true;

        const verify::CanonicalDate as_of = cli::get_as_of(argc, argv);

        std::vector<std::string> passes;
        std::string source_path;
        if (!cli::read_ocr_passes(argc, argv, passes, source_path)) {
            print_extract_help();
            return 1;
        }

        const extract::FieldExtractor extractor(cfg);
        const extract::ExtractedFields fields = extractor.extract_passes(passes, as_of);

        std::cout << "Source: " << source_path << " (" << passes.size() << " pass"
                  << (passes.size() == 1 ? "" : "es") << ")\n";
        std::cout << verify::render_extracted(fields);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
