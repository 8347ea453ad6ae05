#include "verify/Similarity.hpp"
#include "text/TextUtil.hpp"

#include <algorithm>
#include <vector>

namespace verify {

size_t levenshtein(const std::string& a, const std::string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

double edit_similarity(const std::string& a, const std::string& b) {
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(a, b)) / static_cast<double>(longest);
}

std::string normalize_name(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        out.push_back(alnum ? static_cast<char>(c) : ' ');
    }
    return textutil::to_upper_ascii(textutil::collapse_spaces(out));
}

std::string sorted_token_form(const std::string& s) {
    std::vector<std::string> tokens = textutil::tokenize_words(normalize_name(s));
    std::sort(tokens.begin(), tokens.end());

    std::string out;
    for (const auto& t : tokens) {
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

double name_similarity(const std::string& a, const std::string& b) {
    const double raw = edit_similarity(normalize_name(a), normalize_name(b));
    const double sorted = edit_similarity(sorted_token_form(a), sorted_token_form(b));
    return std::max(raw, sorted);
}

}  // namespace verify
