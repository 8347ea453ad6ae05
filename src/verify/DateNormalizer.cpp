#include "verify/CanonicalDate.hpp"
#include "verify/Errors.hpp"
#include "text/TextUtil.hpp"

#include <cstdio>
#include <ctime>
#include <regex>
#include <vector>

namespace verify {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

CanonicalDate CanonicalDate::make(int year, int month, int day, int max_year) {
    if (year < kMinYear || year > max_year) {
        throw DateParseError("year " + std::to_string(year) + " outside [" + std::to_string(kMinYear) + ", " +
                             std::to_string(max_year) + "]");
    }
    if (month < 1 || month > 12) {
        throw DateParseError("month " + std::to_string(month) + " out of range");
    }
    if (day < 1 || day > days_in_month(year, month)) {
        throw DateParseError("day " + std::to_string(day) + " invalid for " + std::to_string(year) + "-" +
                             std::to_string(month));
    }
    return CanonicalDate(year, month, day);
}

std::string CanonicalDate::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d-%02d-%04d", day_, month_, year_);
    return buf;
}

std::string CanonicalDate::to_iso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
    return buf;
}

CanonicalDate today() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    const int y = tm.tm_year + 1900;
    return CanonicalDate::make(y, tm.tm_mon + 1, tm.tm_mday, y);
}

int current_year() {
    return today().year();
}

// ASCII month table; never consults the C locale
static int month_from_name(const std::string& raw) {
    static const char* names[12] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };

    const std::string s = textutil::to_lower_ascii(raw);
    if (s.size() < 3) return 0;
    if (s == "sept") return 9;

    for (int i = 0; i < 12; ++i) {
        const std::string full = names[i];
        if (s.size() <= full.size() && full.compare(0, s.size(), s) == 0) return i + 1;
    }
    return 0;
}

static int to_int(const std::string& digits) {
    int v = 0;
    for (char c : digits) v = v * 10 + (c - '0');
    return v;
}

namespace {

enum class Form { DayFirst, YearFirst, DayMonthName, MonthNameDay, DaySpaced, YearSpaced };

struct DateForm {
    Form form;
    std::regex re;
};

const std::vector<DateForm>& date_forms() {
    static const std::vector<DateForm> forms = {
        {Form::DayFirst,     std::regex(R"(^(\d{1,2})([/\-])(\d{1,2})\2(\d{4})$)")},
        {Form::YearFirst,    std::regex(R"(^(\d{4})([/\-])(\d{1,2})\2(\d{1,2})$)")},
        {Form::DayMonthName, std::regex(R"(^(\d{1,2})[ /\-]+([A-Za-z]{3,9})\.?[ /\-,]+(\d{4})$)")},
        {Form::MonthNameDay, std::regex(R"(^([A-Za-z]{3,9})\.?[ \-]+(\d{1,2})(?:st|nd|rd|th)?(?:, *| +)(\d{4})$)")},
        {Form::DaySpaced,    std::regex(R"(^(\d{1,2}) (\d{1,2}) (\d{4})$)")},
        {Form::YearSpaced,   std::regex(R"(^(\d{4}) (\d{1,2}) (\d{1,2})$)")},
    };
    return forms;
}

}  // namespace

CanonicalDate parse_date(const std::string& text, int max_year) {
    std::string s = textutil::collapse_spaces(text);
    while (!s.empty() && (s.back() == '.' || s.back() == ',')) s.pop_back();
    if (s.empty()) throw DateParseError("empty date string");

    std::string last_error;

    for (const auto& f : date_forms()) {
        std::smatch m;
        if (!std::regex_match(s, m, f.re)) continue;

        int y = 0, mo = 0, d = 0;
        switch (f.form) {
            case Form::DayFirst:
                d = to_int(m[1].str()); mo = to_int(m[3].str()); y = to_int(m[4].str());
                break;
            case Form::YearFirst:
                y = to_int(m[1].str()); mo = to_int(m[3].str()); d = to_int(m[4].str());
                break;
            case Form::DayMonthName:
                d = to_int(m[1].str()); mo = month_from_name(m[2].str()); y = to_int(m[3].str());
                break;
            case Form::MonthNameDay:
                mo = month_from_name(m[1].str()); d = to_int(m[2].str()); y = to_int(m[3].str());
                break;
            case Form::DaySpaced:
                d = to_int(m[1].str()); mo = to_int(m[2].str()); y = to_int(m[3].str());
                break;
            case Form::YearSpaced:
                y = to_int(m[1].str()); mo = to_int(m[2].str()); d = to_int(m[3].str());
                break;
        }

        if (mo == 0) {
            last_error = "unknown month name in '" + s + "'";
            continue;
        }

        try {
            return CanonicalDate::make(y, mo, d, max_year);
        } catch (const DateParseError& e) {
            last_error = e.what();
        }
    }

    if (!last_error.empty()) throw DateParseError("invalid date '" + s + "': " + last_error);
    throw DateParseError("unrecognized date format: '" + s + "'");
}

CanonicalDate parse_date(const std::string& text) {
    return parse_date(text, current_year());
}

std::optional<CanonicalDate> try_parse_date(const std::string& text, int max_year) {
    try {
        return parse_date(text, max_year);
    } catch (const DateParseError&) {
        return std::nullopt;
    }
}

}  // namespace verify
