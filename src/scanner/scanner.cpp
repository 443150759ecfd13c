#include "scanner/scanner.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace dlpscan {

Scanner::Scanner(PatternCatalog::Ptr catalog)
    : catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw std::invalid_argument("Scanner requires a pattern catalog");
    }
}

std::vector<Candidate> Scanner::scan(std::string_view text) const {
    std::vector<Candidate> candidates;
    if (text.empty()) {
        return candidates;
    }

    for (const auto& category : catalog_->categories()) {
        for (const auto& pattern : category.patterns) {
            scan_pattern(category.id, pattern, text, candidates);
        }
    }
    return candidates;
}

void Scanner::scan_pattern(
    CategoryId category,
    const PatternDescriptor& pattern,
    std::string_view text,
    std::vector<Candidate>& out) {

    const re2::RE2& re = *pattern.regex;
    const re2::StringPiece input(text.data(), text.size());

    // Group 0 = whole match, group 1 = payload (when the grammar has one)
    const int nsub = pattern.captures_payload() ? 2 : 1;
    std::array<re2::StringPiece, 2> sub;

    size_t pos = 0;
    while (pos <= text.size()) {
        // Match() sees the whole input, so \b at pos honours the preceding byte
        if (!re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, sub.data(), nsub)) {
            break;
        }

        const re2::StringPiece& whole = sub[0];
        const size_t match_start = static_cast<size_t>(whole.data() - input.data());
        const size_t match_end = match_start + whole.size();

        const re2::StringPiece& payload =
            (nsub == 2 && sub[1].data() != nullptr) ? sub[1] : whole;

        if (!payload.empty()) {
            Candidate c;
            c.category = category;
            c.label = pattern.label;
            c.sensitivity = pattern.sensitivity;
            c.value.assign(payload.data(), payload.size());
            c.start = static_cast<size_t>(payload.data() - input.data());
            c.end = c.start + payload.size();
            c.confidence = pattern.base_confidence;
            out.emplace_back(std::move(c));
        }

        // Empty match: step one byte so the loop always advances
        pos = whole.empty() ? match_end + 1 : match_end;
    }
}

} // namespace dlpscan
