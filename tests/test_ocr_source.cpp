#include <catch2/catch.hpp>

#include "io/JsonIO.hpp"
#include "ocr/OcrSource.hpp"
#include "ocr/ProcUtil.hpp"
#include "ocr/TesseractOcrSource.hpp"
#include "ocr/TextFileOcrSource.hpp"
#include "text/TextUtil.hpp"
#include "verify/Verifier.hpp"

#include <stdexcept>
#include <string>

static const std::string kDataDir = IDCHECK_TEST_DATA_DIR;

TEST_CASE("text file source returns one pass", "[ocr]") {
    ocr::TextFileOcrSource src;
    const auto passes = src.read_passes(kDataDir + "/card_ocr.txt");
    REQUIRE(passes.size() == 1);
    REQUIRE(passes[0].find("JOHN") != std::string::npos);

    REQUIRE(textutil::normalize_ocr(passes[0]) ==
            "GOVERNMENT OF INDIA\n"
            "Name: JOHN DOE\n"
            "DOB: 15-08-1995\n"
            "Male\n"
            "Aadhaar No.: 1234 5678 9012");

    REQUIRE_THROWS_AS(src.read_passes(kDataDir + "/missing.txt"), std::runtime_error);
}

TEST_CASE("source chosen by extension", "[ocr]") {
    REQUIRE(ocr::make_ocr_source("card.txt")->describe() == "text file");
    REQUIRE(ocr::make_ocr_source("CARD.TXT")->describe() == "text file");
    REQUIRE(ocr::make_ocr_source("card.png")->describe() == "tesseract");
    REQUIRE(ocr::make_ocr_source("card")->describe() == "tesseract");
}

TEST_CASE("tesseract command lines", "[ocr]") {
    ocr::TesseractOcrSource src;

    const std::string first = src.command_for("card.png", 0);
    REQUIRE(first.find("'tesseract' 'card.png' stdout") == 0);
    REQUIRE(first.find("--psm 6") != std::string::npos);
    REQUIRE(first.find("tessedit_char_whitelist=") != std::string::npos);

    const std::string second = src.command_for("card.png", 1);
    REQUIRE(second.find("--psm 4") != std::string::npos);
    REQUIRE(second.find("tessedit_char_whitelist") == std::string::npos);

    REQUIRE(src.command_for("card.png", 2).find("--psm 11") != std::string::npos);
    REQUIRE_THROWS_AS(src.command_for("card.png", 3), std::out_of_range);

    ocr::TesseractOptions opts;
    opts.lang = "eng+hin";
    opts.whitelist_first_pass = false;
    ocr::TesseractOcrSource hindi(opts);
    const std::string cmd = hindi.command_for("card.png", 0);
    REQUIRE(cmd.find("-l 'eng+hin'") != std::string::npos);
    REQUIRE(cmd.find("tessedit_char_whitelist") == std::string::npos);
}

TEST_CASE("missing image is reported before running tesseract", "[ocr]") {
    ocr::TesseractOcrSource src;
    REQUIRE_THROWS_AS(src.read_passes(kDataDir + "/no_such_card.png"), std::runtime_error);
}

TEST_CASE("shell quoting", "[ocr]") {
    REQUIRE(procutil::shell_quote("card.png") == "'card.png'");
    REQUIRE(procutil::shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("captured process output", "[ocr]") {
    const procutil::ProcResult ok = procutil::run_capture_stdout("printf 'abc'");
    REQUIRE(ok.exit_code == 0);
    REQUIRE(ok.output == "abc");

    REQUIRE(procutil::run_capture_stdout("exit 3").exit_code == 3);
    REQUIRE(procutil::command_exists("sh"));
    REQUIRE_FALSE(procutil::command_exists("idcheck-no-such-binary"));
}

TEST_CASE("sample card verifies end to end", "[ocr]") {
    ocr::TextFileOcrSource src;
    const auto passes = src.read_passes(kDataDir + "/card_ocr.txt");
    const auto ref = loadReferenceRecord(kDataDir + "/reference.json");
    const auto as_of = verify::CanonicalDate::make(2023, 8, 20, 2023);

    const verify::VerificationReport r = verify::verify_passes(passes, ref, as_of);
    REQUIRE(r.all_match());
    REQUIRE(r.age_years().value_or(-1) == 28);
    REQUIRE(r.extracted().id_rule == "id_labeled");
}
