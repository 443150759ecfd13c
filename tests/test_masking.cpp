#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

using namespace dlpscan;

namespace {

Match make_match(size_t start, size_t end, const std::string& masked) {
    Match m;
    m.category = CategoryId::PASSWORD;
    m.label = "test";
    m.masked_text = masked;
    m.sensitivity = Sensitivity::CRITICAL;
    m.confidence = 0.9;
    m.start = start;
    m.end = end;
    return m;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        size_t extra = 0;
        if (lead < 0x80) extra = 0;
        else if ((lead & 0xE0) == 0xC0) extra = 1;
        else if ((lead & 0xF0) == 0xE0) extra = 2;
        else if ((lead & 0xF8) == 0xF0) extra = 3;
        else return false;
        if (i + extra >= s.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

// ============================================================================
// MaskingEngine::mask tests
// ============================================================================

TEST_CASE("Masking CARD_LAST4 keeps last four digits", "[masking]") {
    CHECK(MaskingEngine::mask("4532015112830366", MaskPolicy::CARD_LAST4) == "****-****-****-0366");
    CHECK(MaskingEngine::mask("4532-0151-1283-0366", MaskPolicy::CARD_LAST4) == "****-****-****-0366");
    CHECK(MaskingEngine::mask("4532 0151 1283 0366", MaskPolicy::CARD_LAST4) == "****-****-****-0366");
}

TEST_CASE("Masking PHONE_LAST4 keeps last four digits", "[masking]") {
    CHECK(MaskingEngine::mask("555-123-4567", MaskPolicy::PHONE_LAST4) == "***-***-4567");
    CHECK(MaskingEngine::mask("+94 771234567", MaskPolicy::PHONE_LAST4) == "***-***-4567");
}

TEST_CASE("Masking NATIONAL_ID_LAST4 keeps last four", "[masking]") {
    CHECK(MaskingEngine::mask("123-45-6789", MaskPolicy::NATIONAL_ID_LAST4) == "***-**-6789");
    CHECK(MaskingEngine::mask("123456789", MaskPolicy::NATIONAL_ID_LAST4) == "***-**-6789");
}

TEST_CASE("Masking EMAIL keeps first char and domain", "[masking]") {
    CHECK(MaskingEngine::mask("john@example.com", MaskPolicy::EMAIL) == "j***@example.com");
    CHECK(MaskingEngine::mask("a@b.io", MaskPolicy::EMAIL) == "a***@b.io");
}

TEST_CASE("Masking EMAIL falls back to PARTIAL on malformed input", "[masking]") {
    // No '@'
    CHECK(MaskingEngine::mask("johnexample", MaskPolicy::EMAIL) == "jo*******le");
    // Two '@'
    CHECK(MaskingEngine::mask("a@b@c.com", MaskPolicy::EMAIL) == "a@*****om");
    // Empty local part
    CHECK(MaskingEngine::mask("@example.com", MaskPolicy::EMAIL) == "@e********om");
}

TEST_CASE("Masking FULL caps at twelve stars", "[masking]") {
    CHECK(MaskingEngine::mask("secretPass123", MaskPolicy::FULL) == "************");
    CHECK(MaskingEngine::mask("1234", MaskPolicy::FULL) == "****");
    CHECK(MaskingEngine::mask("", MaskPolicy::FULL).empty());
    CHECK(MaskingEngine::mask(std::string(200, 'x'), MaskPolicy::FULL).size() == 12);
}

TEST_CASE("Masking PARTIAL reveals two characters each side", "[masking]") {
    CHECK(MaskingEngine::mask("S1234567D", MaskPolicy::PARTIAL) == "S1*****7D");
    CHECK(MaskingEngine::mask("abcde", MaskPolicy::PARTIAL) == "ab*de");
}

TEST_CASE("Masking PARTIAL stars short values entirely", "[masking]") {
    CHECK(MaskingEngine::mask("abcd", MaskPolicy::PARTIAL) == "****");
    CHECK(MaskingEngine::mask("ab", MaskPolicy::PARTIAL) == "**");
    CHECK(MaskingEngine::mask("", MaskPolicy::PARTIAL).empty());
}

TEST_CASE("Masking last-four policies hide values of four digits or fewer", "[masking]") {
    CHECK(MaskingEngine::mask("1234", MaskPolicy::CARD_LAST4) == "****-****-****-****");
    CHECK(MaskingEngine::mask("12-3", MaskPolicy::PHONE_LAST4) == "***-***-***");
}

TEST_CASE("Masking counts characters, not bytes", "[masking][utf8]") {
    SECTION("PARTIAL keeps whole characters at both ends") {
        const auto masked = MaskingEngine::mask("\xE2\x82\xAC" "5,000", MaskPolicy::PARTIAL);
        CHECK(masked == "\xE2\x82\xAC" "5**00");
        CHECK(is_valid_utf8(masked));
    }

    SECTION("Four characters are starred even when they take more bytes") {
        CHECK(MaskingEngine::mask("\xC2\xA3" "900", MaskPolicy::PARTIAL) == "****");
    }

    SECTION("EMAIL keeps the whole first character of the local part") {
        const auto masked = MaskingEngine::mask("\xC3\xA9lodie@example.com", MaskPolicy::EMAIL);
        CHECK(masked == "\xC3\xA9***@example.com");
        CHECK(is_valid_utf8(masked));
    }

    SECTION("FULL emits one star per character") {
        CHECK(MaskingEngine::mask("p\xC3\xA4ss", MaskPolicy::FULL) == "****");
    }

    SECTION("Last-four policies keep whole characters") {
        const auto masked = MaskingEngine::mask("ID\xC3\x9C" "1234\xC3\x9C", MaskPolicy::NATIONAL_ID_LAST4);
        CHECK(masked == "***-**-234\xC3\x9C");
        CHECK(is_valid_utf8(masked));
    }
}

TEST_CASE("Masking by category picks the category policy", "[masking]") {
    CHECK(MaskingEngine::mask("4532015112830366", CategoryId::CREDIT_CARD) == "****-****-****-0366");
    CHECK(MaskingEngine::mask("123-45-6789", CategoryId::SSN) == "***-**-6789");
    CHECK(MaskingEngine::mask("1234", CategoryId::PIN) == "****");
    CHECK(MaskingEngine::mask("123", CategoryId::CVV) == "***");
    CHECK(MaskingEngine::mask("S1234567D", CategoryId::NATIONAL_ID) == "S1*****7D");
}

TEST_CASE("Masking never echoes a value longer than four characters", "[masking]") {
    for (const char* raw : {"secretPass123", "4532015112830366", "john@example.com", "S1234567D"}) {
        for (const auto policy : {MaskPolicy::CARD_LAST4, MaskPolicy::PHONE_LAST4,
                                  MaskPolicy::NATIONAL_ID_LAST4, MaskPolicy::EMAIL,
                                  MaskPolicy::FULL, MaskPolicy::PARTIAL}) {
            CHECK(MaskingEngine::mask(raw, policy) != raw);
        }
    }
}

// ============================================================================
// MaskingEngine::redact tests
// ============================================================================

TEST_CASE("Redact replaces each span with its masked text", "[masking][redact]") {
    const std::string text = "Password: secretPass123";
    const std::vector<Match> matches = {make_match(10, 23, "************")};
    CHECK(MaskingEngine::redact(text, matches) == "Password: ************");
}

TEST_CASE("Redact leaves text without matches unchanged", "[masking][redact]") {
    CHECK(MaskingEngine::redact("nothing here", {}) == "nothing here");
    CHECK(MaskingEngine::redact("", {}).empty());
}

TEST_CASE("Redact handles unordered and overlapping spans", "[masking][redact]") {
    // "0123456789abcdef"
    const std::string text = "0123456789abcdef";

    SECTION("Disjoint spans in any order") {
        const std::vector<Match> matches = {make_match(10, 12, "XX"), make_match(0, 2, "YY")};
        CHECK(MaskingEngine::redact(text, matches) == "YY23456789XXcdef");
    }

    SECTION("Overlap stars the uncovered tail") {
        const std::vector<Match> matches = {make_match(2, 6, "[A]"), make_match(4, 9, "[B]")};
        // [2,6) -> "[A]", then bytes 6..8 of the second span become stars
        CHECK(MaskingEngine::redact(text, matches) == "01[A]***9abcdef");
    }

    SECTION("Nested span is absorbed") {
        const std::vector<Match> matches = {make_match(3, 5, "in"), make_match(2, 8, "outer")};
        CHECK(MaskingEngine::redact(text, matches) == "01outer89abcdef");
    }
}

// ============================================================================
// MaskingEngine::fingerprint tests
// ============================================================================

TEST_CASE("Fingerprint is deterministic 16-hex output", "[masking]") {
    const auto a = MaskingEngine::fingerprint("My SSN is 123-45-6789");
    const auto b = MaskingEngine::fingerprint("My SSN is 123-45-6789");
    CHECK(a == b);
    CHECK(a.size() == 16);
    for (char c : a) {
        CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
    CHECK(a != MaskingEngine::fingerprint("My SSN is 123-45-6780"));

    // SHA-256("") = e3b0c442 98fc1c14 ...
    CHECK(MaskingEngine::fingerprint("") == "e3b0c44298fc1c14");
}
