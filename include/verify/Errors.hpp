#pragma once

#include <stdexcept>
#include <string>

namespace verify {

// unparseable or calendar-invalid date string
class DateParseError : public std::runtime_error {
public:
    explicit DateParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// as-of date precedes the date of birth
class InvalidDateError : public std::runtime_error {
public:
    explicit InvalidDateError(const std::string& msg) : std::runtime_error(msg) {}
};

// malformed input handed to the engine itself (reference record, config, as-of date)
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace verify
