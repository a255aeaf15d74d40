#include "common/suggest.hpp"

#include <algorithm>
#include <cctype>

namespace cdl {

auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t {
    const size_t m = s1.size();
    const size_t n = s2.size();
    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            auto c1 = std::tolower(static_cast<unsigned char>(s1[i - 1]));
            auto c2 = std::tolower(static_cast<unsigned char>(s2[j - 1]));
            size_t cost = c1 == c2 ? 0 : 1;
            curr_row[j] = std::min({prev_row[j] + 1, curr_row[j - 1] + 1, prev_row[j - 1] + cost});
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

auto find_similar(std::string_view input, const std::vector<std::string>& candidates,
                  size_t max_results, size_t max_distance) -> std::vector<std::string> {
    if (input.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    for (const auto& candidate : candidates) {
        if (candidate == input)
            continue;
        size_t len_diff = input.size() > candidate.size() ? input.size() - candidate.size()
                                                          : candidate.size() - input.size();
        if (len_diff > max_distance)
            continue;

        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    for (size_t i = 0; i < scored.size() && i < max_results; ++i) {
        result.push_back(scored[i].first);
    }
    return result;
}

} // namespace cdl
