#pragma once
#include <memory>
#include <string>
#include <vector>

namespace ocr {

// Supplies OCR text for one document. Several passes may come back (e.g. one
// per page-segmentation mode); they are alternatives, not pages.
class OcrSource {
public:
    virtual ~OcrSource() = default;

    // throws std::runtime_error when no text can be produced
    virtual std::vector<std::string> read_passes(const std::string& path) = 0;

    virtual std::string describe() const = 0;
};

// ".txt" -> TextFileOcrSource, anything else -> TesseractOcrSource
std::unique_ptr<OcrSource> make_ocr_source(const std::string& path);

} // namespace ocr
