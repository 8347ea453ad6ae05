#pragma once

#include "ocr/OcrSource.hpp"

namespace ocr {

// Text that was OCR'd elsewhere, stored as a UTF-8 file. One pass.
class TextFileOcrSource final : public OcrSource {
public:
    std::vector<std::string> read_passes(const std::string& path) override;
    std::string describe() const override { return "text file"; }
};

} // namespace ocr
