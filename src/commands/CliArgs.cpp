#include "commands/CliArgs.hpp"

#include "ocr/OcrSource.hpp"
#include "ocr/TextFileOcrSource.hpp"
#include "verify/Errors.hpp"

#include <iostream>
#include <memory>

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

verify::CanonicalDate get_as_of(int argc, char** argv) {
    const std::string s = get_arg(argc, argv, "--as_of", "");
    if (s.empty()) return verify::today();

    // any year from kMinYear on is a legal as-of date
    auto d = verify::try_parse_date(s, 9999);
    if (!d) throw verify::InvalidInputError("invalid --as_of date: " + s);
    return *d;
}

bool read_ocr_passes(int argc, char** argv, std::vector<std::string>& passes, std::string& source_path) {
    const std::string text_path = get_arg(argc, argv, "--text", "");
    const std::string image_path = get_arg(argc, argv, "--image", "");

    if (!text_path.empty()) {
        ocr::TextFileOcrSource src;
        passes = src.read_passes(text_path);
        source_path = text_path;
        return true;
    }

    if (!image_path.empty()) {
        std::unique_ptr<ocr::OcrSource> src = ocr::make_ocr_source(image_path);
        passes = src->read_passes(image_path);
        source_path = image_path;
        if (passes.empty()) {
            std::cerr << "warn: " << src->describe() << " produced no text for " << image_path << "\n";
            std::cerr << "hint: check the image resolution, or pass OCR output with --text\n";
        }
        return true;
    }

    std::cerr << "error: missing --text or --image\n";
    return false;
}

}  // namespace cli
