#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace dlpscan {

/**
 * @brief Applies every catalog grammar to a text and collects raw candidates
 *
 * For each descriptor, all non-overlapping occurrences are found left to
 * right. Candidate offsets are byte offsets into the scanned text, using the
 * payload span (group 1) for keyword-anchored grammars.
 *
 * Stateless apart from the catalog snapshot it holds; safe to share.
 */
class Scanner {
public:
    explicit Scanner(PatternCatalog::Ptr catalog);

    [[nodiscard]] std::vector<Candidate> scan(std::string_view text) const;

    [[nodiscard]] const PatternCatalog& catalog() const { return *catalog_; }

private:
    static void scan_pattern(
        CategoryId category,
        const PatternDescriptor& pattern,
        std::string_view text,
        std::vector<Candidate>& out);

    PatternCatalog::Ptr catalog_;
};

} // namespace dlpscan
