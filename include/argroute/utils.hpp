#ifndef ARGROUTE_UTILS_HPP
#define ARGROUTE_UTILS_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argroute::utils {

// Edit distance with a single rolling row.
inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    if (b.empty()) return a.size();

    std::vector<std::size_t> row(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) row[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            row[j] = std::min({above + 1, row[j - 1] + 1, diagonal + cost});
            diagonal = above;
        }
    }
    return row[b.size()];
}

// `--name` and `-name` both compare as `name`, so a wrong dash count still finds the option.
inline std::string_view stripDashes(std::string_view s) {
    const auto pos = s.find_first_not_of('-');
    return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
}

// Candidates within `maxDistance` edits of `input`, closest first. Used only for messages;
// routing itself never matches by prefix or distance.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxDistance = 2,
                                        std::size_t maxResults = 3) {
    struct Scored {
        const std::string* value;
        std::size_t score;
    };

    const auto bare = stripDashes(input);
    std::vector<Scored> scored;
    for (const auto& c : candidates) {
        if (c.empty() || c == input) continue;
        const auto d = std::min(levenshteinDistance(input, c), levenshteinDistance(bare, stripDashes(c)));
        if (d <= maxDistance) scored.push_back({&c, d});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) { return a.score < b.score; });

    std::vector<std::string> out;
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (std::find(out.begin(), out.end(), *s.value) == out.end()) out.push_back(*s.value);
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace argroute::utils

#endif // ARGROUTE_UTILS_HPP
