#include "text/TextUtil.hpp"
#include <cctype>
#include <unordered_set>

namespace textutil {

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && is_space(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && is_space(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::string to_upper_ascii(std::string s) {
    for (char& c : s) if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    return s;
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char c : s) {
        if (is_space(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::string cur;
    cur.reserve(128);

    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    lines.push_back(cur);
    return lines;
}

std::vector<std::string> tokenize_words(const std::string& s) {
    std::vector<std::string> tokens;
    std::string cur;

    for (unsigned char c : s) {
        if (is_space(c)) {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(static_cast<char>(c));
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

bool is_label_only_line(const std::string& line) {
    // lowercase ASCII forms; Devanagari labels are compared byte-for-byte
    static const std::unordered_set<std::string> labels = {
        "name", "dob", "d.o.b", "d.o.b.", "date of birth", "birth date",
        "year of birth", "yob",
        "aadhaar", "aadhar", "aadhaar no", "aadhaar no.", "aadhaar number",
        "aadhar no", "aadhar no.", "aadhar number", "uid", "uid no", "uid no.", "vid",
        "\xE0\xA4\xA8\xE0\xA4\xBE\xE0\xA4\xAE",  // नाम
        "\xE0\xA4\x9C\xE0\xA4\xA8\xE0\xA5\x8D\xE0\xA4\xAE \xE0\xA4\xA4\xE0\xA4\xBF\xE0\xA4\xA5\xE0\xA4\xBF",  // जन्म तिथि
        "\xE0\xA4\x86\xE0\xA4\xA7\xE0\xA4\xBE\xE0\xA4\xB0",  // आधार
    };

    std::string t = trim(line);
    while (!t.empty() && (t.back() == ':' || t.back() == '-' || t.back() == ' ')) t.pop_back();
    if (t.empty()) return false;
    return labels.count(to_lower_ascii(collapse_spaces(t))) > 0;
}

std::string normalize_ocr(const std::string& raw) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(raw)) {
        std::string c = collapse_spaces(line);
        if (!c.empty()) kept.push_back(std::move(c));
    }

    std::string out;
    out.reserve(raw.size());

    for (size_t i = 0; i < kept.size(); ++i) {
        std::string line = kept[i];

        // "Name" on one line, "JOHN DOE" on the next
        if (i + 1 < kept.size() && is_label_only_line(line) && !is_label_only_line(kept[i + 1])) {
            while (!line.empty() && (line.back() == ':' || line.back() == '-' || line.back() == ' ')) line.pop_back();
            line += ": " + kept[i + 1];
            ++i;
        }

        if (!out.empty()) out.push_back('\n');
        out += line;
    }
    return out;
}

}
