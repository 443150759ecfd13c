#include "analyzer/match_deduplicator.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace dlpscan {

bool MatchDeduplicator::ranks_before(const Match& a, const Match& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
}

MatchDeduplicator::DedupeResult MatchDeduplicator::dedupe(std::vector<Match> matches) {
    DedupeResult result;

    // Stable: equal-ranked matches keep catalog order, so the winner is deterministic
    std::stable_sort(matches.begin(), matches.end(), ranks_before);

    std::set<std::pair<size_t, size_t>> seen;
    result.matches.reserve(matches.size());

    for (auto& match : matches) {
        if (!seen.emplace(match.start, match.end).second) {
            continue;
        }
        if (sensitivity_rank(match.sensitivity) > sensitivity_rank(result.max_sensitivity)) {
            result.max_sensitivity = match.sensitivity;
        }
        result.matches.emplace_back(std::move(match));
    }

    return result;
}

} // namespace dlpscan
