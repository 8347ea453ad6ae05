#include "extract/IdFormat.hpp"

namespace idformat {

std::string digits_only(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c >= '0' && c <= '9') out.push_back(c);
    }
    return out;
}

bool is_well_formed(const std::string& digits) {
    if (digits.size() != kIdDigits) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool verhoeff_valid(const std::string& digits) {
    // dihedral group D5 multiplication and position permutation tables
    static const int d[10][10] = {
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
        {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
        {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
        {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
        {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
        {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
        {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
        {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
        {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
    };
    static const int p[8][10] = {
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
        {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
        {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
        {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
        {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
        {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
        {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
    };

    if (digits.empty()) return false;

    int c = 0;
    size_t i = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i) {
        if (*it < '0' || *it > '9') return false;
        c = d[c][p[i % 8][*it - '0']];
    }
    return c == 0;
}

bool passes_aadhaar_rules(const std::string& digits) {
    if (!is_well_formed(digits)) return false;
    if (digits[0] == '0' || digits[0] == '1') return false;
    return verhoeff_valid(digits);
}

std::string group_digits(const std::string& digits) {
    if (!is_well_formed(digits)) return digits;
    return digits.substr(0, 4) + " " + digits.substr(4, 4) + " " + digits.substr(8, 4);
}

} // namespace idformat
