#pragma once

#include "analyzer/match_deduplicator.hpp"
#include "catalog/pattern_catalog.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dlpscan {

/**
 * @brief Sensitive-data detection entry point
 *
 * Pipeline:
 *   Scanner -> CandidateValidator -> MaskingEngine -> MatchDeduplicator
 *   -> RiskAggregator
 *
 * Raw matched values are dropped at the masking step; nothing returned by
 * the engine carries them.
 *
 * Thread-safety: analyze()/summarize() take no locks. The catalog is
 * hot-reloadable via RCU (atomic shared_ptr); a call works on the snapshot
 * it loaded at entry.
 */
class DetectionEngine {
public:
    /**
     * @param catalog Initial catalog (must not be null)
     * @param min_confidence Matches below this are dropped before dedupe
     * @throws std::invalid_argument on null catalog or min_confidence outside [0, 1]
     */
    explicit DetectionEngine(PatternCatalog::Ptr catalog, double min_confidence = 0.0);

    /**
     * @brief Tier view of the text
     */
    [[nodiscard]] ScanReport analyze(std::string_view text) const;

    /**
     * @brief Absent input is reported as an empty (NONE) report
     */
    [[nodiscard]] ScanReport analyze(const std::optional<std::string>& text) const;

    /**
     * @brief Score view of the text
     */
    [[nodiscard]] RiskSummary summarize(std::string_view text) const;

    /**
     * @brief Ranked, deduplicated matches (shared by both views)
     */
    [[nodiscard]] MatchDeduplicator::DedupeResult detect(std::string_view text) const;

    /**
     * @brief Swap in a prebuilt catalog (RCU update). Null is rejected.
     */
    void reload_catalog(PatternCatalog::Ptr catalog);

    /**
     * @brief Build a catalog from config and swap it in
     * @return Pattern count of the new catalog; on error the old one stays live
     */
    Result<size_t> reload_catalog(const CatalogConfig& config);

    [[nodiscard]] PatternCatalog::Ptr catalog() const;
    [[nodiscard]] double min_confidence() const { return min_confidence_; }

    static double round_confidence(double confidence);

private:
    [[nodiscard]] std::vector<Match> build_matches(
        const PatternCatalog::Ptr& catalog,
        std::string_view text) const;

    // RCU: readers load the shared_ptr atomically, writers build offline and swap
    std::atomic<PatternCatalog::Ptr> catalog_;

    // Single writer
    mutable std::mutex reload_mutex_;

    const double min_confidence_;
};

} // namespace dlpscan
