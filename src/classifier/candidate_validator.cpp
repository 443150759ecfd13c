#include "classifier/candidate_validator.hpp"

#include <cctype>
#include <string>

namespace dlpscan {

std::optional<Candidate> CandidateValidator::validate(Candidate candidate) {
    if (candidate.category != CategoryId::CREDIT_CARD) {
        return candidate;
    }

    if (!luhn_check(candidate.value)) {
        candidate.confidence *= kChecksumPenalty;
        if (candidate.confidence < kConfidenceFloor) {
            return std::nullopt;
        }
    }
    return candidate;
}

bool CandidateValidator::luhn_check(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        digits += c;
    }

    if (digits.size() < 13) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

} // namespace dlpscan
