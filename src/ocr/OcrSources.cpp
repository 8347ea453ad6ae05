#include "ocr/OcrSource.hpp"
#include "ocr/ProcUtil.hpp"
#include "ocr/TesseractOcrSource.hpp"
#include "ocr/TextFileOcrSource.hpp"
#include "text/TextUtil.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace ocr {

std::vector<std::string> TextFileOcrSource::read_passes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open OCR text file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return {ss.str()};
}

TesseractOcrSource::TesseractOcrSource(TesseractOptions opts) : opts_(std::move(opts)) {}

std::string TesseractOcrSource::command_for(const std::string& image_path, size_t pass_index) const {
    const int psm = opts_.psm_modes.at(pass_index);

    std::string cmd = procutil::shell_quote(opts_.binary) + " " + procutil::shell_quote(image_path) + " stdout";
    cmd += " -l " + procutil::shell_quote(opts_.lang);
    cmd += " --oem 3 --psm " + std::to_string(psm);
    if (pass_index == 0 && opts_.whitelist_first_pass && !opts_.whitelist.empty()) {
        cmd += " -c " + procutil::shell_quote("tessedit_char_whitelist=" + opts_.whitelist);
    }
    cmd += " 2>/dev/null";
    return cmd;
}

std::vector<std::string> TesseractOcrSource::read_passes(const std::string& image_path) {
    if (!fs::exists(image_path)) {
        throw std::runtime_error("image not found: " + image_path);
    }
    if (!procutil::command_exists(opts_.binary)) {
        throw std::runtime_error(opts_.binary + " not found. Please install tesseract-ocr (e.g., apt-get install -y tesseract-ocr).");
    }

    std::vector<std::string> passes;
    int failures = 0;

    for (size_t i = 0; i < opts_.psm_modes.size(); ++i) {
        const procutil::ProcResult res = procutil::run_capture_stdout(command_for(image_path, i));
        if (res.exit_code != 0) {
            ++failures;
            continue;
        }
        if (!textutil::trim(res.output).empty()) passes.push_back(res.output);
    }

    if (passes.empty() && failures > 0) {
        throw std::runtime_error(opts_.binary + " failed on every pass for: " + image_path);
    }
    return passes;
}

std::unique_ptr<OcrSource> make_ocr_source(const std::string& path) {
    const std::string ext = textutil::to_lower_ascii(fs::path(path).extension().string());
    if (ext == ".txt" || ext == ".text") {
        return std::make_unique<TextFileOcrSource>();
    }
    return std::make_unique<TesseractOcrSource>();
}

} // namespace ocr
