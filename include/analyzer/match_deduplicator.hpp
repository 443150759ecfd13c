#pragma once

#include "core/types.hpp"
#include <vector>

namespace dlpscan {

/**
 * @brief Resolves identical spans and ranks the surviving matches
 *
 * Matches are ordered by descending confidence (ties: ascending start, then
 * ascending end) and the first match per exact (start, end) span is kept.
 * Overlapping spans that are not identical all survive. Running dedupe on
 * its own output returns it unchanged.
 */
class MatchDeduplicator {
public:
    struct DedupeResult {
        std::vector<Match> matches;
        Sensitivity max_sensitivity = Sensitivity::NONE;
    };

    [[nodiscard]] static DedupeResult dedupe(std::vector<Match> matches);

    /**
     * @brief Ranking order used for reports
     */
    [[nodiscard]] static bool ranks_before(const Match& a, const Match& b);
};

} // namespace dlpscan
