#include <catch2/catch_test_macros.hpp>
#include "analyzer/risk_aggregator.hpp"

using namespace dlpscan;

namespace {

Match make_match(CategoryId category, Sensitivity sensitivity, size_t start = 0) {
    Match m;
    m.category = category;
    m.label = category_to_string(category);
    m.masked_text = "****";
    m.sensitivity = sensitivity;
    m.confidence = 0.9;
    m.start = start;
    m.end = start + 4;
    return m;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Tier view
// ============================================================================

TEST_CASE("Aggregate: empty match set is safe", "[aggregator]") {
    const auto report = RiskAggregator::aggregate({}, Sensitivity::NONE);
    CHECK_FALSE(report.has_sensitive_data);
    CHECK(report.overall_sensitivity == Sensitivity::NONE);
    CHECK(report.total_matches == 0);
    CHECK(report.categories.empty());
    CHECK(report.matches.empty());
    CHECK(report.recommendation == "No sensitive data detected. Safe to send.");
}

TEST_CASE("Aggregate: stray max_sensitivity with no matches is NONE", "[aggregator]") {
    const auto report = RiskAggregator::aggregate({}, Sensitivity::HIGH);
    CHECK(report.overall_sensitivity == Sensitivity::NONE);
}

TEST_CASE("Aggregate: recommendation per tier", "[aggregator]") {
    SECTION("LOW") {
        const auto report = RiskAggregator::aggregate(
            {make_match(CategoryId::EMAIL, Sensitivity::LOW)}, Sensitivity::LOW);
        CHECK(report.overall_sensitivity == Sensitivity::LOW);
        CHECK(contains(report.recommendation, "Low sensitivity"));
    }
    SECTION("MEDIUM") {
        const auto report = RiskAggregator::aggregate(
            {make_match(CategoryId::PHONE, Sensitivity::MEDIUM)}, Sensitivity::MEDIUM);
        CHECK(contains(report.recommendation, "Verify you trust the recipient"));
    }
    SECTION("HIGH") {
        const auto report = RiskAggregator::aggregate(
            {make_match(CategoryId::PASSPORT, Sensitivity::HIGH)}, Sensitivity::HIGH);
        CHECK(contains(report.recommendation, "Only send if absolutely necessary"));
    }
    SECTION("CRITICAL") {
        const auto report = RiskAggregator::aggregate(
            {make_match(CategoryId::SSN, Sensitivity::CRITICAL)}, Sensitivity::CRITICAL);
        CHECK(contains(report.recommendation, "CRITICAL"));
        CHECK(contains(report.recommendation, "(ssn)"));
        CHECK(contains(report.recommendation, "NOT sending"));
    }
}

TEST_CASE("Aggregate: critical names at most three categories in ranked order", "[aggregator]") {
    std::vector<Match> ranked = {
        make_match(CategoryId::PASSWORD, Sensitivity::CRITICAL, 0),
        make_match(CategoryId::CREDIT_CARD, Sensitivity::CRITICAL, 10),
        make_match(CategoryId::PASSWORD, Sensitivity::CRITICAL, 20),
        make_match(CategoryId::EMAIL, Sensitivity::LOW, 30),
        make_match(CategoryId::PIN, Sensitivity::CRITICAL, 40),
    };
    const auto report = RiskAggregator::aggregate(ranked, Sensitivity::CRITICAL);
    CHECK(contains(report.recommendation, "(password, credit_card, email)"));
    CHECK_FALSE(contains(report.recommendation, "pin"));

    CHECK(report.total_matches == 5);
    CHECK(report.categories.size() == 4);
    CHECK(report.categories.count(CategoryId::PIN) == 1);
}

TEST_CASE("Aggregate: matches are passed through in order", "[aggregator]") {
    std::vector<Match> ranked = {
        make_match(CategoryId::PHONE, Sensitivity::MEDIUM, 5),
        make_match(CategoryId::EMAIL, Sensitivity::LOW, 1),
    };
    const auto report = RiskAggregator::aggregate(ranked, Sensitivity::MEDIUM);
    REQUIRE(report.matches.size() == 2);
    CHECK(report.matches[0].start == 5);
    CHECK(report.matches[1].start == 1);
}

// ============================================================================
// Score view
// ============================================================================

TEST_CASE("Score: tier weights", "[aggregator][score]") {
    CHECK(RiskAggregator::tier_score(Sensitivity::NONE) == 0);
    CHECK(RiskAggregator::tier_score(Sensitivity::LOW) == 10);
    CHECK(RiskAggregator::tier_score(Sensitivity::MEDIUM) == 25);
    CHECK(RiskAggregator::tier_score(Sensitivity::HIGH) == 50);
    CHECK(RiskAggregator::tier_score(Sensitivity::CRITICAL) == 100);
}

TEST_CASE("Score: peak plus capped volume", "[aggregator][score]") {
    CHECK(RiskAggregator::risk_score({}) == 0);

    // One LOW: 10 + 5
    CHECK(RiskAggregator::risk_score({make_match(CategoryId::EMAIL, Sensitivity::LOW)}) == 15);

    // MEDIUM + LOW: 25 + 10
    CHECK(RiskAggregator::risk_score({
        make_match(CategoryId::PHONE, Sensitivity::MEDIUM),
        make_match(CategoryId::EMAIL, Sensitivity::LOW, 10)}) == 35);

    // Six HIGH: volume capped at 20
    std::vector<Match> many;
    for (size_t i = 0; i < 6; ++i) {
        many.push_back(make_match(CategoryId::PASSPORT, Sensitivity::HIGH, i * 10));
    }
    CHECK(RiskAggregator::risk_score(many) == 70);

    // CRITICAL saturates at 100
    CHECK(RiskAggregator::risk_score({make_match(CategoryId::SSN, Sensitivity::CRITICAL)}) == 100);
}

TEST_CASE("Score: level buckets", "[aggregator][score]") {
    CHECK(RiskAggregator::level_for_score(0) == RiskLevel::SAFE);
    CHECK(RiskAggregator::level_for_score(1) == RiskLevel::LOW);
    CHECK(RiskAggregator::level_for_score(24) == RiskLevel::LOW);
    CHECK(RiskAggregator::level_for_score(25) == RiskLevel::MEDIUM);
    CHECK(RiskAggregator::level_for_score(49) == RiskLevel::MEDIUM);
    CHECK(RiskAggregator::level_for_score(50) == RiskLevel::HIGH);
    CHECK(RiskAggregator::level_for_score(74) == RiskLevel::HIGH);
    CHECK(RiskAggregator::level_for_score(75) == RiskLevel::CRITICAL);
    CHECK(RiskAggregator::level_for_score(100) == RiskLevel::CRITICAL);
}

TEST_CASE("Summarize: detections re-project the matches", "[aggregator][score]") {
    std::vector<Match> ranked = {
        make_match(CategoryId::PHONE, Sensitivity::MEDIUM),
        make_match(CategoryId::EMAIL, Sensitivity::LOW, 10),
    };
    ranked[0].label = "Phone number (US)";
    ranked[0].masked_text = "***-***-4567";

    const auto summary = RiskAggregator::summarize(ranked);
    CHECK(summary.risk_score == 35);
    CHECK(summary.risk_level == RiskLevel::MEDIUM);
    CHECK(summary.total_detections == 2);
    CHECK_FALSE(summary.message.empty());

    REQUIRE(summary.detections.size() == 2);
    CHECK(summary.detections[0].type == "Phone number (US)");
    CHECK(summary.detections[0].category == CategoryId::PHONE);
    CHECK(summary.detections[0].masked_value == "***-***-4567");
    CHECK(summary.detections[0].sensitivity == Sensitivity::MEDIUM);
    CHECK_FALSE(summary.detections[0].recommendation.empty());
}

TEST_CASE("Summarize: empty input is safe", "[aggregator][score]") {
    const auto summary = RiskAggregator::summarize({});
    CHECK(summary.risk_score == 0);
    CHECK(summary.risk_level == RiskLevel::SAFE);
    CHECK(summary.total_detections == 0);
    CHECK(summary.detections.empty());
}
