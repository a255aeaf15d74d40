//! # "Did You Mean?" Suggestions
//!
//! Edit-distance helpers shared by the parser (unknown statement keywords)
//! and by `cdlc run` (unknown commands and flags).

#ifndef CDL_COMMON_SUGGEST_HPP
#define CDL_COMMON_SUGGEST_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cdl {

/// Case-insensitive Levenshtein distance.
[[nodiscard]] auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t;

/// Candidates within `max_distance` of `input`, closest first, at most
/// `max_results` of them. Exact matches are skipped.
[[nodiscard]] auto find_similar(std::string_view input, const std::vector<std::string>& candidates,
                                size_t max_results = 3, size_t max_distance = 2)
    -> std::vector<std::string>;

} // namespace cdl

#endif // CDL_COMMON_SUGGEST_HPP
