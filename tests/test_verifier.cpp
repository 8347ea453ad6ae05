#include <catch2/catch.hpp>

#include "verify/Errors.hpp"
#include "verify/ReportArtifact.hpp"
#include "verify/TextSummary.hpp"
#include "verify/Verifier.hpp"

#include <string>
#include <vector>

using verify::CanonicalDate;
using verify::ReferenceRecord;
using verify::VerificationReport;

static const std::string kCardText = "Name: JOHN DOE\nDOB: 15-08-1995\nAadhaar: 1234 5678 9012";

static CanonicalDate as_of() {
    return CanonicalDate::make(2023, 8, 20, 2023);
}

static ReferenceRecord john() {
    ReferenceRecord r;
    r.name = "John Doe";
    r.dob = "15/08/1995";
    r.id_number = "1234 5678 9012";
    return r;
}

TEST_CASE("matching card", "[verify]") {
    const VerificationReport r = verify::verify(kCardText, john(), as_of());

    REQUIRE(r.name().matched);
    REQUIRE(r.dob().matched);
    REQUIRE(r.id().matched);
    REQUIRE(r.all_match());

    REQUIRE(r.age_years().has_value());
    REQUIRE(*r.age_years() == 28);
    REQUIRE(r.is_teen().has_value());
    REQUIRE_FALSE(*r.is_teen());
    REQUIRE(r.as_of() == as_of());
}

TEST_CASE("name mismatch leaves the other fields alone", "[verify]") {
    ReferenceRecord ref = john();
    ref.name = "Jane Smith";
    const VerificationReport r = verify::verify(kCardText, ref, as_of());

    REQUIRE_FALSE(r.name().matched);
    REQUIRE(r.name().similarity < 0.5);
    REQUIRE(r.dob().matched);
    REQUIRE(r.id().matched);
    REQUIRE_FALSE(r.all_match());
    REQUIRE(r.age_years().value_or(-1) == 28);
}

TEST_CASE("absent DOB propagates to age and teen flag", "[verify]") {
    const VerificationReport r = verify::verify("Name: JOHN DOE\nAadhaar: 1234 5678 9012", john(), as_of());

    REQUIRE_FALSE(r.dob().matched);
    REQUIRE_FALSE(r.age_years().has_value());
    REQUIRE_FALSE(r.is_teen().has_value());
    REQUIRE(r.name().matched);
    REQUIRE(r.id().matched);
    REQUIRE_FALSE(r.all_match());
}

TEST_CASE("age comes from the document, not the reference", "[verify]") {
    ReferenceRecord ref = john();
    ref.dob = "01/01/2010";
    const VerificationReport r = verify::verify(kCardText, ref, as_of());

    REQUIRE_FALSE(r.dob().matched);
    REQUIRE(r.age_years().value_or(-1) == 28);
}

TEST_CASE("teen policy is configurable", "[verify]") {
    const std::string text = "Name: Priya Verma\nDOB: 01/01/2005\nAadhaar: 2345 6789 0124";

    verify::VerifyConfig band;
    const VerificationReport a = verify::verify(text, ReferenceRecord{}, as_of(), band);
    REQUIRE(a.age_years().value_or(-1) == 18);
    REQUIRE(a.is_teen().value_or(false));

    verify::VerifyConfig under18;
    under18.teen_policy = verify::TeenPolicy::Under18;
    const VerificationReport b = verify::verify(text, ReferenceRecord{}, as_of(), under18);
    REQUIRE_FALSE(b.is_teen().value_or(true));
}

TEST_CASE("empty reference and empty text never throw", "[verify]") {
    const VerificationReport r = verify::verify("", ReferenceRecord{}, as_of());
    REQUIRE_FALSE(r.all_match());
    REQUIRE_FALSE(r.name().matched);
    REQUIRE_FALSE(r.age_years().has_value());
}

TEST_CASE("malformed engine inputs fail fast", "[verify]") {
    verify::VerifyConfig cfg;
    cfg.name_threshold = 1.5;
    REQUIRE_THROWS_AS(verify::verify(kCardText, john(), as_of(), cfg), verify::InvalidInputError);

    const std::string with_nul("Name: JOHN\0DOE", 14);
    REQUIRE_THROWS_AS(verify::verify(with_nul, john(), as_of()), verify::InvalidInputError);
}

TEST_CASE("several OCR passes", "[verify]") {
    const std::vector<std::string> passes = {"Name: JOHN DOE", "DOB: 15-08-1995\nAadhaar: 1234 5678 9012"};
    const VerificationReport r = verify::verify_passes(passes, john(), as_of());
    REQUIRE(r.all_match());
}

TEST_CASE("identical inputs give identical reports", "[verify]") {
    const VerificationReport a = verify::verify(kCardText, john(), as_of());
    const VerificationReport b = verify::verify(kCardText, john(), as_of());

    verify::ReportArtifact art_a;
    art_a.report = &a;
    verify::ReportArtifact art_b;
    art_b.report = &b;
    REQUIRE(art_a.to_json().dump() == art_b.to_json().dump());
}

TEST_CASE("report JSON", "[verify]") {
    const VerificationReport r = verify::verify(kCardText, john(), as_of());

    verify::ReportArtifact art;
    art.reference_path = "ref.json";
    art.ocr_source = "card.txt";
    art.teen_policy = "band";
    art.report = &r;

    const nlohmann::json j = art.to_json();
    REQUIRE(j.at("all_match").get<bool>());
    REQUIRE(j.at("age").get<int>() == 28);
    REQUIRE_FALSE(j.at("is_teen").get<bool>());
    REQUIRE(j.at("as_of").get<std::string>() == "2023-08-20");
    REQUIRE(j.at("name").at("matched").get<bool>());
    REQUIRE(j.at("id_number").at("expected").get<std::string>() == "1234 5678 9012");
    REQUIRE(j.at("extracted").at("id_number").get<std::string>() == "123456789012");
    REQUIRE(j.at("extracted").at("dob").get<std::string>() == "1995-08-15");
    REQUIRE(j.at("extracted").at("rules").at("name").get<std::string>() == "name_labeled");
    REQUIRE(j.at("teen_policy").get<std::string>() == "band");

    verify::ReportArtifact empty;
    REQUIRE_THROWS(empty.to_json());
}

TEST_CASE("text summary", "[verify]") {
    const VerificationReport r = verify::verify(kCardText, john(), as_of());
    const std::string s = verify::render_text_summary(r);

    REQUIRE(s.find("All details match: Yes") != std::string::npos);
    REQUIRE(s.find("Name matches: Yes (JOHN DOE") != std::string::npos);
    REQUIRE(s.find("Aadhaar: 1234 5678 9012") != std::string::npos);
    REQUIRE(s.find("Age: 28 (Not teen)") != std::string::npos);

    const VerificationReport none = verify::verify("", john(), as_of());
    const std::string t = verify::render_text_summary(none);
    REQUIRE(t.find("All details match: No") != std::string::npos);
    REQUIRE(t.find("Name: Not found") != std::string::npos);
    REQUIRE(t.find("Age:") == std::string::npos);
}

TEST_CASE("back-of-card text does not replace the holder's name", "[verify]") {
    ReferenceRecord ref = john();
    ref.id_number = "2345 6789 0124";
    const VerificationReport r = verify::verify(
        "GOVERNMENT OF INDIA\nJOHN DOE\nDOB: 15/08/1995\nMALE\n2345 6789 0124\n"
        "Aadhaar is proof of identity, not of citizenship.\n"
        "To establish identity, authenticate online.",
        ref, as_of());

    REQUIRE(r.name().extracted_value.value_or("") == "JOHN DOE");
    REQUIRE(r.all_match());
}

TEST_CASE("a calendar-invalid DOB gives no age", "[verify]") {
    ReferenceRecord ref = john();
    ref.id_number = "2345 6789 0124";
    const VerificationReport r = verify::verify(
        "Name: JOHN DOE\nDOB: 31/04/1995\nIssue Date: 01/02/2020\nAadhaar: 2345 6789 0124", ref, as_of());

    REQUIRE_FALSE(r.dob().matched);
    REQUIRE_FALSE(r.age_years().has_value());
    REQUIRE_FALSE(r.is_teen().has_value());
    REQUIRE(r.name().matched);
    REQUIRE(r.id().matched);
}
