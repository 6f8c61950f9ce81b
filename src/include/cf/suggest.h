#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

namespace cf {

// Number of single-character insertions, deletions and substitutions needed
// to turn one string into the other.
inline int levenshtein_distance(const std::string& a, const std::string& b) {
    std::vector<int> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest candidate to `name`, or "" when nothing is within 3 edits or 40% of
// the name's length.
inline std::string suggest_similar(const std::string& name, const std::vector<std::string>& candidates) {
    int best = std::numeric_limits<int>::max();
    std::string match;
    for (auto const& c : candidates) {
        int d = levenshtein_distance(name, c);
        if (d < best) {
            best = d;
            match = c;
        }
    }
    int threshold = std::max(3, static_cast<int>(name.size() * 0.4));
    return best <= threshold ? match : std::string();
}

}  // namespace cf
