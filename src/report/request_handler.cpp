#include "report/request_handler.hpp"
#include "analyzer/risk_aggregator.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "report/report_serializer.hpp"

#include <format>

namespace dlpscan {

RequestHandler::RequestHandler(const DetectionEngine& engine, AggregationStrategy aggregation)
    : engine_(engine), aggregation_(aggregation) {}

Result<ScanRequest> RequestHandler::parse_request(const std::string& line) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(line);
    } catch (const JsonValue::parse_error& e) {
        return Result<ScanRequest>::error(ErrorCategory::INVALID_INPUT, e.what());
    }

    if (!doc.is_object()) {
        return Result<ScanRequest>::error(ErrorCategory::INVALID_INPUT,
            "request must be a JSON object");
    }

    ScanRequest request;
    request.text = doc.string_field("text");
    request.source = doc.string_or("source", kDefaultSource);
    request.direction = doc.string_or("direction", kDefaultDirection);
    return Result<ScanRequest>::ok(std::move(request));
}

std::string RequestHandler::error_json(ErrorCategory category, std::string_view message) {
    return std::format("{{\"error\":\"{}\",\"category\":\"{}\"}}",
        utils::escape_json(message), error_category_to_string(category));
}

std::string RequestHandler::render(const MatchDeduplicator::DedupeResult& result) const {
    if (aggregation_ == AggregationStrategy::SCORE) {
        return ReportSerializer::to_json(RiskAggregator::summarize(result.matches));
    }
    return ReportSerializer::to_json(
        RiskAggregator::aggregate(result.matches, result.max_sensitivity));
}

std::string RequestHandler::handle_line(const std::string& line) const {
    auto parsed = parse_request(line);
    if (parsed.is_error()) {
        utils::log::warn(std::format("Skipping request line: {}", parsed.error_message()));
        return error_json(parsed.error_category(), parsed.error_message());
    }
    const ScanRequest& request = parsed.value();

    MatchDeduplicator::DedupeResult result;
    if (request.text) {
        try {
            result = engine_.detect(*request.text);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Scan failed for request from {}: {}",
                request.source, e.what()));
            return error_json(ErrorCategory::INTERNAL_ERROR, "scan failed");
        }
    } else {
        utils::log::debug("Request without usable text field, reporting empty result");
    }

    const std::string_view text = request.text ? std::string_view(*request.text)
                                               : std::string_view{};
    const auto envelope = ReportSerializer::make_envelope(
        text, result.matches, request.source, request.direction);
    return ReportSerializer::envelope_to_json(envelope, aggregation_, render(result));
}

} // namespace dlpscan
