#include "core/detection_engine.hpp"
#include "analyzer/risk_aggregator.hpp"
#include "classifier/candidate_validator.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "scanner/scanner.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace dlpscan {

DetectionEngine::DetectionEngine(PatternCatalog::Ptr catalog, double min_confidence)
    : min_confidence_(min_confidence) {
    if (!catalog) {
        throw std::invalid_argument("DetectionEngine requires a pattern catalog");
    }
    if (min_confidence < 0.0 || min_confidence > 1.0) {
        throw std::invalid_argument(std::format(
            "min_confidence must be within [0, 1], got {}", min_confidence));
    }
    std::atomic_store_explicit(&catalog_, std::move(catalog), std::memory_order_release);
}

ScanReport DetectionEngine::analyze(std::string_view text) const {
    auto result = detect(text);
    return RiskAggregator::aggregate(std::move(result.matches), result.max_sensitivity);
}

ScanReport DetectionEngine::analyze(const std::optional<std::string>& text) const {
    if (!text) {
        return RiskAggregator::aggregate({}, Sensitivity::NONE);
    }
    return analyze(std::string_view(*text));
}

RiskSummary DetectionEngine::summarize(std::string_view text) const {
    const auto result = detect(text);
    return RiskAggregator::summarize(result.matches);
}

MatchDeduplicator::DedupeResult DetectionEngine::detect(std::string_view text) const {
    // RCU read: one snapshot for the whole call
    const auto snapshot = std::atomic_load_explicit(&catalog_, std::memory_order_acquire);
    return MatchDeduplicator::dedupe(build_matches(snapshot, text));
}

std::vector<Match> DetectionEngine::build_matches(
    const PatternCatalog::Ptr& catalog,
    std::string_view text) const {

    std::vector<Match> matches;
    if (text.empty()) {
        return matches;
    }

    const Scanner scanner(catalog);
    auto candidates = scanner.scan(text);
    matches.reserve(candidates.size());

    for (auto& raw : candidates) {
        auto validated = CandidateValidator::validate(std::move(raw));
        if (!validated) continue;

        const double confidence = round_confidence(validated->confidence);
        if (confidence < min_confidence_) continue;

        Match m;
        m.category = validated->category;
        m.label = std::move(validated->label);
        m.masked_text = MaskingEngine::mask(validated->value, validated->category);
        m.sensitivity = validated->sensitivity;
        m.confidence = confidence;
        m.start = validated->start;
        m.end = validated->end;
        matches.emplace_back(std::move(m));
    }
    return matches;
}

void DetectionEngine::reload_catalog(PatternCatalog::Ptr catalog) {
    if (!catalog) {
        utils::log::warn("Ignoring catalog reload: no catalog supplied");
        return;
    }
    std::lock_guard<std::mutex> lock(reload_mutex_);
    const size_t patterns = catalog->pattern_count();
    std::atomic_store_explicit(&catalog_, std::move(catalog), std::memory_order_release);
    utils::log::info(std::format("Pattern catalog reloaded: {} patterns", patterns));
}

Result<size_t> DetectionEngine::reload_catalog(const CatalogConfig& config) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    auto built = PatternCatalog::build(config);
    if (built.is_error()) {
        utils::log::error(std::format("Catalog reload failed, keeping current catalog: {}",
            built.error_message()));
        return Result<size_t>::error(built.error_category(), built.error_message());
    }

    auto catalog = built.value();
    const size_t patterns = catalog->pattern_count();
    std::atomic_store_explicit(&catalog_, std::move(catalog), std::memory_order_release);
    utils::log::info(std::format("Pattern catalog reloaded: {} patterns", patterns));
    return Result<size_t>::ok(patterns);
}

PatternCatalog::Ptr DetectionEngine::catalog() const {
    return std::atomic_load_explicit(&catalog_, std::memory_order_acquire);
}

double DetectionEngine::round_confidence(double confidence) {
    return std::round(confidence * 100.0) / 100.0;
}

} // namespace dlpscan
