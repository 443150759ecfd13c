#include "core/masking.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace dlpscan {

static constexpr size_t kFullMaskCap = 12;
static constexpr size_t kRevealDigits = 4;
static constexpr size_t kPartialReveal = 2;

// Byte offset of each UTF-8 code point, followed by value.size()
static std::vector<size_t> codepoint_offsets(std::string_view value) {
    std::vector<size_t> offsets;
    offsets.reserve(value.size() + 1);
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 0 || (static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(value.size());
    return offsets;
}

std::string MaskingEngine::mask(std::string_view raw, MaskPolicy policy) {
    switch (policy) {
        case MaskPolicy::CARD_LAST4:
            return "****-****-****-" + last_n(strip_separators(raw), kRevealDigits);

        case MaskPolicy::PHONE_LAST4:
            return "***-***-" + last_n(strip_separators(raw), kRevealDigits);

        case MaskPolicy::NATIONAL_ID_LAST4:
            return "***-**-" + last_n(strip_separators(raw), kRevealDigits);

        case MaskPolicy::EMAIL:
            return email_mask(raw);

        case MaskPolicy::FULL:
            return std::string(std::min(codepoint_offsets(raw).size() - 1, kFullMaskCap), '*');

        case MaskPolicy::PARTIAL:
            return partial_mask(raw);
    }
    return std::string(raw.size(), '*');
}

std::string MaskingEngine::mask(std::string_view raw, CategoryId category) {
    return mask(raw, policy_for(category));
}

MaskPolicy MaskingEngine::policy_for(CategoryId category) {
    switch (category) {
        case CategoryId::CREDIT_CARD:
            return MaskPolicy::CARD_LAST4;
        case CategoryId::PHONE:
            return MaskPolicy::PHONE_LAST4;
        case CategoryId::SSN:
            return MaskPolicy::NATIONAL_ID_LAST4;
        case CategoryId::EMAIL:
            return MaskPolicy::EMAIL;
        case CategoryId::PASSWORD:
        case CategoryId::PIN:
        case CategoryId::API_KEY:
        case CategoryId::CVV:
            return MaskPolicy::FULL;
        default:
            return MaskPolicy::PARTIAL;
    }
}

std::string MaskingEngine::strip_separators(std::string_view value) {
    std::string clean;
    clean.reserve(value.size());
    for (const char c : value) {
        if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
        clean += c;
    }
    return clean;
}

std::string MaskingEngine::last_n(const std::string& value, size_t n) {
    const auto offsets = codepoint_offsets(value);
    const size_t count = offsets.size() - 1;

    // Nothing left to hide behind the prefix: reveal nothing
    if (count <= n) return std::string(count, '*');
    return value.substr(offsets[count - n]);
}

// Counts are in code points, so multi-byte characters are never split
std::string MaskingEngine::partial_mask(std::string_view value) {
    const auto offsets = codepoint_offsets(value);
    const size_t count = offsets.size() - 1;

    // Too short for a partial reveal: star everything
    if (count <= 2 * kPartialReveal) {
        return std::string(count, '*');
    }

    std::string result;
    result.reserve(value.size());
    result.append(value.substr(0, offsets[kPartialReveal]));
    result.append(count - 2 * kPartialReveal, '*');
    result.append(value.substr(offsets[count - kPartialReveal]));
    return result;
}

std::string MaskingEngine::email_mask(std::string_view value) {
    const size_t at = value.find('@');
    const bool single_at = at != std::string_view::npos &&
                           value.find('@', at + 1) == std::string_view::npos;
    if (!single_at || at == 0) {
        return partial_mask(value);
    }

    const auto offsets = codepoint_offsets(value.substr(0, at));

    std::string result;
    result.reserve(value.size());
    result.append(value.substr(0, offsets[1]));
    result += "***@";
    result.append(value.substr(at + 1));
    return result;
}

std::string MaskingEngine::redact(
    std::string_view text,
    const std::vector<Match>& matches) {

    std::vector<const Match*> ordered;
    ordered.reserve(matches.size());
    for (const auto& m : matches) {
        if (m.start < m.end && m.start < text.size()) {
            ordered.push_back(&m);
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const Match* a, const Match* b) {
        if (a->start != b->start) return a->start < b->start;
        return a->end > b->end;
    });

    std::string result;
    result.reserve(text.size());
    size_t cursor = 0;

    for (const Match* m : ordered) {
        const size_t end = std::min(m->end, text.size());
        if (end <= cursor) continue;

        if (m->start >= cursor) {
            result.append(text.substr(cursor, m->start - cursor));
            result.append(m->masked_text);
        } else {
            // Tail of a span overlapping one already rendered
            result.append(end - cursor, '*');
        }
        cursor = end;
    }

    if (cursor < text.size()) {
        result.append(text.substr(cursor));
    }
    return result;
}

std::string MaskingEngine::fingerprint(std::string_view text) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()),
           text.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(16);
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

} // namespace dlpscan
