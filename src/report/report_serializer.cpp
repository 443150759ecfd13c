#include "report/report_serializer.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"

#include <format>

namespace dlpscan {

std::string ReportSerializer::to_json(const Match& match) {
    return std::format(
        "{{\"category\":\"{}\",\"type\":\"{}\",\"masked_text\":\"{}\","
        "\"sensitivity\":\"{}\",\"confidence\":{:.2f},\"start\":{},\"end\":{}}}",
        category_to_string(match.category), utils::escape_json(match.label),
        utils::escape_json(match.masked_text), sensitivity_to_string(match.sensitivity),
        match.confidence, match.start, match.end);
}

std::string ReportSerializer::to_json(const ScanReport& report) {
    std::string json = std::format(
        "{{\"has_sensitive_data\":{},\"sensitivity_level\":\"{}\",\"total_matches\":{},"
        "\"categories\":[",
        utils::booltostr(report.has_sensitive_data),
        sensitivity_to_string(report.overall_sensitivity),
        report.total_matches);

    bool first = true;
    for (const auto id : report.categories) {
        if (!first) json += ",";
        json += std::format("\"{}\"", category_to_string(id));
        first = false;
    }

    json += "],\"matches\":[";
    for (size_t i = 0; i < report.matches.size(); ++i) {
        if (i > 0) json += ",";
        json += to_json(report.matches[i]);
    }

    json += std::format("],\"recommendation\":\"{}\"}}", utils::escape_json(report.recommendation));
    return json;
}

std::string ReportSerializer::to_json(const RiskSummary& summary) {
    std::string json = std::format(
        "{{\"risk_score\":{},\"risk_level\":\"{}\",\"total_detections\":{},"
        "\"message\":\"{}\",\"detections\":[",
        summary.risk_score, risk_level_to_string(summary.risk_level),
        summary.total_detections, utils::escape_json(summary.message));

    for (size_t i = 0; i < summary.detections.size(); ++i) {
        if (i > 0) json += ",";
        const auto& d = summary.detections[i];
        json += std::format(
            "{{\"type\":\"{}\",\"category\":\"{}\",\"masked_value\":\"{}\","
            "\"sensitivity\":\"{}\",\"recommendation\":\"{}\"}}",
            utils::escape_json(d.type), category_to_string(d.category),
            utils::escape_json(d.masked_value), sensitivity_to_string(d.sensitivity),
            utils::escape_json(d.recommendation));
    }
    json += "]}";
    return json;
}

std::string ReportSerializer::catalog_to_json(const PatternCatalog& catalog) {
    std::string json = "{\"patterns\":[";
    bool first = true;
    for (const auto& category : catalog.categories()) {
        for (const auto& p : category.patterns) {
            if (!first) json += ",";
            json += std::format(
                "{{\"category\":\"{}\",\"type\":\"{}\",\"sensitivity\":\"{}\","
                "\"confidence\":{:.2f},\"recommendation\":\"{}\"}}",
                category.name(), utils::escape_json(p.label),
                sensitivity_to_string(p.sensitivity), p.base_confidence,
                utils::escape_json(category.recommendation));
            first = false;
        }
    }
    json += std::format("],\"total_categories\":{},\"total_patterns\":{}}}",
        catalog.category_count(), catalog.pattern_count());
    return json;
}

std::string ReportSerializer::envelope_to_json(
    const ScanEnvelope& envelope,
    AggregationStrategy aggregation,
    const std::string& body) {

    return std::format(
        "{{\"scan_id\":\"{}\",\"timestamp\":\"{}\",\"source\":\"{}\",\"direction\":\"{}\","
        "\"text_digest\":\"{}\",\"preview\":\"{}\",\"aggregation\":\"{}\",\"report\":{}}}",
        utils::escape_json(envelope.scan_id), utils::escape_json(envelope.timestamp),
        utils::escape_json(envelope.source), utils::escape_json(envelope.direction),
        envelope.text_digest, utils::escape_json(envelope.preview),
        aggregation_to_string(aggregation), body);
}

ScanEnvelope ReportSerializer::make_envelope(
    std::string_view text,
    const std::vector<Match>& matches,
    std::string source,
    std::string direction) {

    ScanEnvelope envelope;
    envelope.scan_id = utils::generate_uuid();
    envelope.timestamp = utils::format_timestamp(utils::now());
    envelope.source = std::move(source);
    envelope.direction = std::move(direction);
    envelope.text_digest = MaskingEngine::fingerprint(text);
    envelope.preview = make_preview(text, matches);
    return envelope;
}

std::string ReportSerializer::make_preview(
    std::string_view text,
    const std::vector<Match>& matches) {

    std::string redacted = MaskingEngine::redact(text, matches);
    if (redacted.size() <= kPreviewBytes) {
        return redacted;
    }

    // Back up to the start of a UTF-8 sequence
    size_t cut = kPreviewBytes;
    while (cut > 0 && (static_cast<unsigned char>(redacted[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    redacted.resize(cut);
    redacted += "...";
    return redacted;
}

} // namespace dlpscan
