#pragma once

#include "core/types.hpp"
#include <optional>
#include <string_view>

namespace dlpscan {

/**
 * @brief Category-specific post-match checks
 *
 * Credit-card candidates are Luhn-checked. A failed check halves the
 * confidence (soft penalty); the candidate is dropped only when the halved
 * confidence falls below 0.5 (hard floor). Other categories pass through.
 * Confidence is never raised.
 */
class CandidateValidator {
public:
    static constexpr double kChecksumPenalty = 0.5;
    static constexpr double kConfidenceFloor = 0.5;

    /**
     * @return The (possibly penalized) candidate, or nullopt to discard it
     */
    [[nodiscard]] static std::optional<Candidate> validate(Candidate candidate);

    /**
     * @brief Luhn (mod 10) check. Separators ('-' and whitespace) are ignored.
     * @return false for non-digit residue or fewer than 13 digits
     */
    [[nodiscard]] static bool luhn_check(std::string_view number);
};

} // namespace dlpscan
