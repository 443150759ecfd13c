#include <catch2/catch_test_macros.hpp>
#include "analyzer/match_deduplicator.hpp"

using namespace dlpscan;

namespace {

Match make_match(CategoryId category, const std::string& label, Sensitivity sensitivity,
                 double confidence, size_t start, size_t end) {
    Match m;
    m.category = category;
    m.label = label;
    m.masked_text = "****";
    m.sensitivity = sensitivity;
    m.confidence = confidence;
    m.start = start;
    m.end = end;
    return m;
}

bool same(const std::vector<Match>& a, const std::vector<Match>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].label != b[i].label || a[i].start != b[i].start ||
            a[i].end != b[i].end || a[i].confidence != b[i].confidence) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("Dedupe: empty input", "[dedupe]") {
    const auto result = MatchDeduplicator::dedupe({});
    CHECK(result.matches.empty());
    CHECK(result.max_sensitivity == Sensitivity::NONE);
}

TEST_CASE("Dedupe: identical span keeps the most confident match", "[dedupe]") {
    std::vector<Match> input = {
        make_match(CategoryId::CREDIT_CARD, "Credit card number", Sensitivity::CRITICAL, 0.70, 18, 34),
        make_match(CategoryId::CREDIT_CARD, "Visa card", Sensitivity::CRITICAL, 0.95, 18, 34),
    };
    const auto result = MatchDeduplicator::dedupe(input);
    REQUIRE(result.matches.size() == 1);
    CHECK(result.matches[0].label == "Visa card");
    CHECK(result.max_sensitivity == Sensitivity::CRITICAL);
}

TEST_CASE("Dedupe: equal confidence on a shared span keeps input order", "[dedupe]") {
    std::vector<Match> input = {
        make_match(CategoryId::SSN, "first", Sensitivity::CRITICAL, 0.95, 0, 11),
        make_match(CategoryId::NATIONAL_ID, "second", Sensitivity::HIGH, 0.95, 0, 11),
    };
    const auto result = MatchDeduplicator::dedupe(input);
    REQUIRE(result.matches.size() == 1);
    CHECK(result.matches[0].label == "first");
}

TEST_CASE("Dedupe: overlapping but distinct spans both survive", "[dedupe]") {
    std::vector<Match> input = {
        make_match(CategoryId::PHONE, "a", Sensitivity::MEDIUM, 0.80, 5, 17),
        make_match(CategoryId::PHONE, "b", Sensitivity::MEDIUM, 0.85, 6, 17),
    };
    const auto result = MatchDeduplicator::dedupe(input);
    CHECK(result.matches.size() == 2);
}

TEST_CASE("Dedupe: ranking order", "[dedupe]") {
    std::vector<Match> input = {
        make_match(CategoryId::EMAIL, "late", Sensitivity::LOW, 0.95, 30, 40),
        make_match(CategoryId::PHONE, "low", Sensitivity::MEDIUM, 0.80, 0, 10),
        make_match(CategoryId::EMAIL, "early", Sensitivity::LOW, 0.95, 12, 20),
        make_match(CategoryId::EMAIL, "early-long", Sensitivity::LOW, 0.95, 12, 25),
    };
    const auto result = MatchDeduplicator::dedupe(input);
    REQUIRE(result.matches.size() == 4);
    CHECK(result.matches[0].label == "early");
    CHECK(result.matches[1].label == "early-long");
    CHECK(result.matches[2].label == "late");
    CHECK(result.matches[3].label == "low");
    CHECK(result.max_sensitivity == Sensitivity::MEDIUM);
}

TEST_CASE("Dedupe: no two survivors share a span", "[dedupe]") {
    std::vector<Match> input;
    for (int i = 0; i < 5; ++i) {
        input.push_back(make_match(CategoryId::PIN, "p", Sensitivity::CRITICAL, 0.5 + 0.1 * i, 3, 7));
        input.push_back(make_match(CategoryId::PIN, "q", Sensitivity::CRITICAL, 0.5, 10, 14 + i));
    }
    const auto result = MatchDeduplicator::dedupe(input);
    CHECK(result.matches.size() == 6);
    for (size_t i = 0; i < result.matches.size(); ++i) {
        for (size_t j = i + 1; j < result.matches.size(); ++j) {
            const bool same_span = result.matches[i].start == result.matches[j].start &&
                                   result.matches[i].end == result.matches[j].end;
            CHECK_FALSE(same_span);
        }
    }
}

TEST_CASE("Dedupe: idempotent", "[dedupe]") {
    std::vector<Match> input = {
        make_match(CategoryId::EMAIL, "e", Sensitivity::LOW, 0.95, 30, 46),
        make_match(CategoryId::PHONE, "p", Sensitivity::MEDIUM, 0.80, 5, 17),
        make_match(CategoryId::PHONE, "p2", Sensitivity::MEDIUM, 0.85, 5, 17),
        make_match(CategoryId::SSN, "s", Sensitivity::CRITICAL, 0.95, 50, 61),
    };
    const auto once = MatchDeduplicator::dedupe(input);
    const auto twice = MatchDeduplicator::dedupe(once.matches);
    CHECK(same(once.matches, twice.matches));
    CHECK(once.max_sensitivity == twice.max_sensitivity);
    CHECK(once.max_sensitivity == Sensitivity::CRITICAL);
}
