#pragma once

#include "ocr/OcrSource.hpp"

namespace ocr {

struct TesseractOptions {
    std::string binary = "tesseract";
    std::string lang = "eng";
    std::vector<int> psm_modes = {6, 4, 11};

    // restrict the first pass to characters that occur on the card
    bool whitelist_first_pass = true;
    std::string whitelist =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz/:,-. ";
};

// Runs the external tesseract CLI once per page-segmentation mode.
class TesseractOcrSource final : public OcrSource {
    TesseractOptions opts_;

public:
    explicit TesseractOcrSource(TesseractOptions opts = {});

    std::vector<std::string> read_passes(const std::string& image_path) override;
    std::string describe() const override { return "tesseract"; }

    // exposed for tests
    std::string command_for(const std::string& image_path, size_t pass_index) const;
};

} // namespace ocr
