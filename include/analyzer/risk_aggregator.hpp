#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace dlpscan {

/**
 * @brief Turns a deduplicated, ranked match set into a verdict
 *
 * Two independent projections of the same matches:
 * - aggregate(): tier view (ScanReport), recommendation templated per tier
 * - summarize(): score view (RiskSummary), additive 0-100 risk score
 */
class RiskAggregator {
public:
    // Peak tier weights for the score view
    static constexpr int kLowScore = 10;
    static constexpr int kMediumScore = 25;
    static constexpr int kHighScore = 50;
    static constexpr int kCriticalScore = 100;

    static constexpr int kPerMatchScore = 5;
    static constexpr int kVolumeCap = 20;
    static constexpr size_t kMaxNamedCategories = 3;

    /**
     * @param matches Output of MatchDeduplicator (already ranked)
     * @param max_sensitivity Highest tier among matches
     */
    [[nodiscard]] static ScanReport aggregate(
        std::vector<Match> matches,
        Sensitivity max_sensitivity);

    [[nodiscard]] static RiskSummary summarize(const std::vector<Match>& matches);

    [[nodiscard]] static std::string recommendation_for(
        Sensitivity level,
        const std::vector<Match>& ranked);

    [[nodiscard]] static int tier_score(Sensitivity level);
    [[nodiscard]] static int risk_score(const std::vector<Match>& matches);
    [[nodiscard]] static RiskLevel level_for_score(int score);
    [[nodiscard]] static const char* message_for(RiskLevel level);
};

} // namespace dlpscan
