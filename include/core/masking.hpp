#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace dlpscan {

/**
 * @brief Masking engine - renders redacted forms of detected values
 *
 * Policies:
 * - CARD_LAST4:        "****-****-****-0366"
 * - PHONE_LAST4:       "***-***-4567"
 * - NATIONAL_ID_LAST4: "***-**-6789"
 * - EMAIL:             "j***@example.com"
 * - FULL:              run of '*' capped at 12
 * - PARTIAL:           first 2 + '*' fill + last 2 (all '*' when len <= 4)
 *
 * Output never reveals more than the policy permits, even for short input.
 */
class MaskingEngine {
public:
    /**
     * @brief Mask a single value with an explicit policy
     */
    [[nodiscard]] static std::string mask(std::string_view raw, MaskPolicy policy);

    /**
     * @brief Mask a single value with the policy of its category
     */
    [[nodiscard]] static std::string mask(std::string_view raw, CategoryId category);

    /**
     * @brief Masking policy attached to a category
     */
    [[nodiscard]] static MaskPolicy policy_for(CategoryId category);

    /**
     * @brief Render the full text with every match span replaced by its
     * masked form. Bytes covered by overlapping spans are starred so that
     * no raw byte of any match survives.
     * @param text Original text the matches were produced from
     * @param matches Matches in any order
     */
    [[nodiscard]] static std::string redact(
        std::string_view text,
        const std::vector<Match>& matches);

    /**
     * @brief SHA256 first 16 hex chars; correlates log records without raw text
     */
    [[nodiscard]] static std::string fingerprint(std::string_view text);

private:
    static std::string strip_separators(std::string_view value);
    static std::string last_n(const std::string& value, size_t n);
    static std::string partial_mask(std::string_view value);
    static std::string email_mask(std::string_view value);
};

} // namespace dlpscan
