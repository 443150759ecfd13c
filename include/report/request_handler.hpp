#pragma once

#include "analyzer/match_deduplicator.hpp"
#include "core/detection_engine.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dlpscan {

/**
 * @brief One decoded JSONL request line
 */
struct ScanRequest {
    std::optional<std::string> text;    // nullopt when missing, null or not a string
    std::string source;
    std::string direction;
};

/**
 * @brief JSONL request boundary: one request line in, one response line out
 *
 * Request:  {"text": "...", "source": "...", "direction": "..."}
 * Response: envelope (scan_id, timestamp, digest, redacted preview) around
 *           the tier report or the score summary.
 *
 * A line that is not a JSON object answers {"error": ..., "category": ...};
 * it never stops the stream. A request without usable text is scanned as
 * absent input and gets an empty report.
 */
class RequestHandler {
public:
    static constexpr const char* kDefaultSource = "unknown";
    static constexpr const char* kDefaultDirection = "outgoing";

    RequestHandler(const DetectionEngine& engine, AggregationStrategy aggregation);

    [[nodiscard]] std::string handle_line(const std::string& line) const;

    /**
     * @brief Report or summary JSON for already detected matches
     */
    [[nodiscard]] std::string render(const MatchDeduplicator::DedupeResult& result) const;

    /**
     * @return The request, or INVALID_INPUT when the line is not a JSON object
     */
    [[nodiscard]] static Result<ScanRequest> parse_request(const std::string& line);

    [[nodiscard]] static std::string error_json(ErrorCategory category, std::string_view message);

    [[nodiscard]] AggregationStrategy aggregation() const { return aggregation_; }

private:
    const DetectionEngine& engine_;
    AggregationStrategy aggregation_;
};

} // namespace dlpscan
