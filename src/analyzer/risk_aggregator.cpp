#include "analyzer/risk_aggregator.hpp"
#include "catalog/pattern_catalog.hpp"

#include <algorithm>
#include <format>

namespace dlpscan {

// ============================================================================
// Tier view
// ============================================================================

ScanReport RiskAggregator::aggregate(std::vector<Match> matches, Sensitivity max_sensitivity) {
    ScanReport report;
    report.has_sensitive_data = !matches.empty();
    report.overall_sensitivity = matches.empty() ? Sensitivity::NONE : max_sensitivity;
    report.total_matches = matches.size();

    for (const auto& m : matches) {
        report.categories.insert(m.category);
    }

    report.recommendation = recommendation_for(report.overall_sensitivity, matches);
    report.matches = std::move(matches);
    return report;
}

std::string RiskAggregator::recommendation_for(Sensitivity level, const std::vector<Match>& ranked) {
    switch (level) {
        case Sensitivity::NONE:
            return "No sensitive data detected. Safe to send.";
        case Sensitivity::LOW:
            return "Low sensitivity data detected. Consider if the recipient needs this information.";
        case Sensitivity::MEDIUM:
            return "Medium sensitivity data detected. Verify you trust the recipient before sending.";
        case Sensitivity::HIGH:
            return "High sensitivity data detected! Only send if absolutely necessary and to trusted recipients.";
        case Sensitivity::CRITICAL:
            break;
    }

    // Categories in order of first appearance among the ranked matches
    std::vector<CategoryId> named;
    for (const auto& m : ranked) {
        if (named.size() == kMaxNamedCategories) break;
        if (std::find(named.begin(), named.end(), m.category) == named.end()) {
            named.push_back(m.category);
        }
    }

    std::string names;
    for (const auto id : named) {
        if (!names.empty()) names += ", ";
        names += category_to_string(id);
    }

    return std::format(
        "CRITICAL: Highly sensitive data detected ({})! "
        "Strongly recommend NOT sending this information via this channel.",
        names);
}

// ============================================================================
// Score view
// ============================================================================

int RiskAggregator::tier_score(Sensitivity level) {
    switch (level) {
        case Sensitivity::NONE: return 0;
        case Sensitivity::LOW: return kLowScore;
        case Sensitivity::MEDIUM: return kMediumScore;
        case Sensitivity::HIGH: return kHighScore;
        case Sensitivity::CRITICAL: return kCriticalScore;
    }
    return 0;
}

int RiskAggregator::risk_score(const std::vector<Match>& matches) {
    if (matches.empty()) return 0;

    int peak = 0;
    for (const auto& m : matches) {
        peak = std::max(peak, tier_score(m.sensitivity));
    }

    const int volume = static_cast<int>(std::min<size_t>(
        matches.size() * kPerMatchScore, kVolumeCap));
    return std::min(100, peak + volume);
}

RiskLevel RiskAggregator::level_for_score(int score) {
    if (score <= 0) return RiskLevel::SAFE;
    if (score < 25) return RiskLevel::LOW;
    if (score < 50) return RiskLevel::MEDIUM;
    if (score < 75) return RiskLevel::HIGH;
    return RiskLevel::CRITICAL;
}

const char* RiskAggregator::message_for(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE:
            return "No sensitive data detected. Message is safe to send.";
        case RiskLevel::LOW:
            return "Low risk: minor personal data detected. Review before sending.";
        case RiskLevel::MEDIUM:
            return "Medium risk: personal data detected. Make sure the recipient is trusted.";
        case RiskLevel::HIGH:
            return "High risk: sensitive data detected. Remove it unless sending is essential.";
        case RiskLevel::CRITICAL:
            return "Critical risk: highly sensitive data detected. Do not send this message.";
    }
    return "";
}

RiskSummary RiskAggregator::summarize(const std::vector<Match>& matches) {
    RiskSummary summary;
    summary.risk_score = risk_score(matches);
    summary.risk_level = level_for_score(summary.risk_score);
    summary.total_detections = matches.size();
    summary.message = message_for(summary.risk_level);

    summary.detections.reserve(matches.size());
    for (const auto& m : matches) {
        Detection d;
        d.type = m.label;
        d.category = m.category;
        d.masked_value = m.masked_text;
        d.sensitivity = m.sensitivity;
        d.recommendation = PatternCatalog::category_recommendation(m.category);
        summary.detections.emplace_back(std::move(d));
    }
    return summary;
}

} // namespace dlpscan
