#pragma once

#include <optional>
#include <string>

namespace verify {

constexpr int kMinYear = 1900;

// Calendar-validated (year, month, day). Only constructible through make(),
// parse_date() or today(), so every instance is a real date.
class CanonicalDate {
public:
    // throws DateParseError if the triple is not a calendar date in [kMinYear, max_year]
    static CanonicalDate make(int year, int month, int day, int max_year);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    std::string to_string() const;  // dd-mm-yyyy
    std::string to_iso() const;     // yyyy-mm-dd

    bool operator==(const CanonicalDate& o) const {
        return year_ == o.year_ && month_ == o.month_ && day_ == o.day_;
    }
    bool operator!=(const CanonicalDate& o) const { return !(*this == o); }
    bool operator<(const CanonicalDate& o) const {
        if (year_ != o.year_) return year_ < o.year_;
        if (month_ != o.month_) return month_ < o.month_;
        return day_ < o.day_;
    }

private:
    CanonicalDate(int y, int m, int d) : year_(y), month_(m), day_(d) {}

    int year_;
    int month_;
    int day_;
};

bool is_leap_year(int year);
int days_in_month(int year, int month);

// current local date
CanonicalDate today();
int current_year();

// Tries, in order: dd/mm/yyyy or dd-mm-yyyy, yyyy-mm-dd, month-name forms
// ("15 Aug 1995", "Aug 15, 1995"), then "dd mm yyyy" and "yyyy mm dd".
// Throws DateParseError when nothing matches or the date is invalid / out of range.
CanonicalDate parse_date(const std::string& text, int max_year);
CanonicalDate parse_date(const std::string& text);

std::optional<CanonicalDate> try_parse_date(const std::string& text, int max_year);

}  // namespace verify
