#include <catch2/catch.hpp>

#include "verify/MatchEngine.hpp"
#include "verify/Similarity.hpp"

#include <optional>
#include <string>

using verify::match_dob;
using verify::match_id;
using verify::match_name;

TEST_CASE("levenshtein and edit similarity", "[similarity]") {
    REQUIRE(verify::levenshtein("kitten", "sitting") == 3);
    REQUIRE(verify::levenshtein("", "abc") == 3);
    REQUIRE(verify::edit_similarity("", "") == Approx(1.0));
    REQUIRE(verify::edit_similarity("J0HN DOE", "JOHN DOE") == Approx(0.875));
}

TEST_CASE("name normalization", "[similarity]") {
    REQUIRE(verify::normalize_name("  john   o'neil ") == "JOHN O NEIL");
    REQUIRE(verify::sorted_token_form("Doe, John") == "DOE JOHN");
    REQUIRE(verify::normalize_name("...").empty());
}

TEST_CASE("name match is case and order insensitive", "[match]") {
    const auto exact = match_name(std::string("JOHN DOE"), "John Doe", 0.80);
    REQUIRE(exact.matched);
    REQUIRE(exact.similarity == Approx(1.0));
    REQUIRE(exact.extracted_value.value_or("") == "JOHN DOE");
    REQUIRE(exact.expected_value == "John Doe");

    const auto swapped = match_name(std::string("JOHN DOE"), "DOE JOHN", 0.80);
    REQUIRE(swapped.matched);
    REQUIRE(swapped.similarity >= 0.80);
}

TEST_CASE("name match tolerates small OCR errors", "[match]") {
    const auto m = match_name(std::string("J0HN DOE"), "John Doe", 0.80);
    REQUIRE(m.matched);
    REQUIRE(m.similarity == Approx(0.875));

    REQUIRE_FALSE(match_name(std::string("J0HN DOE"), "John Doe", 0.90).matched);
}

TEST_CASE("different names do not match", "[match]") {
    const auto m = match_name(std::string("JOHN DOE"), "Jane Smith", 0.80);
    REQUIRE_FALSE(m.matched);
    REQUIRE(m.similarity < 0.5);
}

TEST_CASE("absent or empty names never match", "[match]") {
    const auto absent = match_name(std::nullopt, "John Doe", 0.80);
    REQUIRE_FALSE(absent.matched);
    REQUIRE(absent.similarity == Approx(0.0));
    REQUIRE_FALSE(absent.extracted_value.has_value());

    REQUIRE_FALSE(match_name(std::string("JOHN DOE"), "", 0.0).matched);
    REQUIRE_FALSE(match_name(std::string("--"), "--", 0.0).matched);
}

TEST_CASE("DOB match compares canonical dates", "[match]") {
    const auto m = match_dob(std::string("15-08-1995"), "15/08/1995", 2023);
    REQUIRE(m.matched);
    REQUIRE(m.similarity == Approx(1.0));
    REQUIRE(m.extracted_value.value_or("") == "15-08-1995");

    REQUIRE(match_dob(std::string("15 Aug 1995"), "1995-08-15", 2023).matched);

    const auto off_by_one = match_dob(std::string("15-08-1995"), "1995-08-16", 2023);
    REQUIRE_FALSE(off_by_one.matched);
    REQUIRE(off_by_one.similarity == Approx(0.0));
}

TEST_CASE("unparseable DOB on either side is a non-match", "[match]") {
    const auto bad_expected = match_dob(std::string("15-08-1995"), "garbage", 2023);
    REQUIRE_FALSE(bad_expected.matched);
    REQUIRE(bad_expected.similarity == Approx(0.0));

    const auto bad_found = match_dob(std::string("31/04/1995"), "31/04/1995", 2023);
    REQUIRE_FALSE(bad_found.matched);
    REQUIRE(bad_found.extracted_value.value_or("") == "31/04/1995");

    const auto absent = match_dob(std::nullopt, "15/08/1995", 2023);
    REQUIRE_FALSE(absent.matched);
    REQUIRE_FALSE(absent.extracted_value.has_value());
}

TEST_CASE("ID match ignores separators", "[match]") {
    REQUIRE(match_id(std::string("1234 5678 9012"), "123456789012").matched);
    REQUIRE(match_id(std::string("123456789012"), "1234-5678-9012").matched);
    REQUIRE_FALSE(match_id(std::string("123456789012"), "123456789013").matched);
}

TEST_CASE("malformed IDs never match", "[match]") {
    const auto short_id = match_id(std::string("12345678901"), "12345678901");
    REQUIRE_FALSE(short_id.matched);
    REQUIRE(short_id.similarity == Approx(0.0));

    REQUIRE_FALSE(match_id(std::string("123456789012"), "").matched);
    REQUIRE_FALSE(match_id(std::nullopt, "123456789012").matched);
}
