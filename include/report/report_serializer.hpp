#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dlpscan {

/**
 * @brief Per-request metadata written around a report
 *
 * Carries no raw text: only a digest and a redacted preview.
 */
struct ScanEnvelope {
    std::string scan_id;
    std::string timestamp;
    std::string source;
    std::string direction;
    std::string text_digest;
    std::string preview;
};

/**
 * @brief JSON rendering of reports, summaries and the catalog
 */
class ReportSerializer {
public:
    static constexpr size_t kPreviewBytes = 100;

    [[nodiscard]] static std::string to_json(const ScanReport& report);
    [[nodiscard]] static std::string to_json(const RiskSummary& summary);
    [[nodiscard]] static std::string to_json(const Match& match);

    /**
     * @brief Catalog listing: one entry per descriptor, in evaluation order
     */
    [[nodiscard]] static std::string catalog_to_json(const PatternCatalog& catalog);

    /**
     * @param body Already serialized report or summary
     */
    [[nodiscard]] static std::string envelope_to_json(
        const ScanEnvelope& envelope,
        AggregationStrategy aggregation,
        const std::string& body);

    /**
     * @brief Build the envelope for one scanned text
     * @param matches Matches of that text (used to redact the preview)
     */
    [[nodiscard]] static ScanEnvelope make_envelope(
        std::string_view text,
        const std::vector<Match>& matches,
        std::string source,
        std::string direction);

    /**
     * @brief Redacted text cut to kPreviewBytes (on a UTF-8 boundary), "..." when cut
     */
    [[nodiscard]] static std::string make_preview(
        std::string_view text,
        const std::vector<Match>& matches);
};

} // namespace dlpscan
