#include "StringSimilarity.hpp"
#include <algorithm>
#include <vector>

size_t levenshtein_distance(const std::string& a, const std::string& b) {
    // Keep the shorter string on the inner dimension
    const std::string& s = (a.size() < b.size()) ? a : b;
    const std::string& t = (a.size() < b.size()) ? b : a;

    std::vector<size_t> prev(s.size() + 1);
    std::vector<size_t> curr(s.size() + 1);
    for (size_t j = 0; j <= s.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= t.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= s.size(); ++j) {
            size_t cost = (t[i - 1] == s[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[s.size()];
}

double similarity(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    if (a == b) return 1.0;
    return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(longest);
}

double similarity_upper_bound(size_t len_a, size_t len_b) {
    size_t longest = std::max(len_a, len_b);
    if (longest == 0) return 1.0;
    size_t diff = (len_a > len_b) ? len_a - len_b : len_b - len_a;
    return 1.0 - static_cast<double>(diff) / static_cast<double>(longest);
}
