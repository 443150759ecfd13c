#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dlpscan {

// ============================================================================
// Basic Enums
// ============================================================================

// Total order: NONE < LOW < MEDIUM < HIGH < CRITICAL
enum class Sensitivity : uint8_t {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class CategoryId : uint8_t {
    CREDIT_CARD,
    BANK_ACCOUNT,
    CVV,
    SSN,
    NATIONAL_ID,
    PASSPORT,
    DRIVERS_LICENSE,
    PASSWORD,
    PIN,
    API_KEY,
    PHONE,
    EMAIL,
    ADDRESS,
    DOB,
    MEDICAL,
    CONFIDENTIAL,
    SALARY,
    IP_ADDRESS
};

inline constexpr size_t kCategoryCount = 18;

enum class MaskPolicy {
    CARD_LAST4,         // ****-****-****-1234
    PHONE_LAST4,        // ***-***-1234
    NATIONAL_ID_LAST4,  // ***-**-1234
    EMAIL,              // j***@example.com
    FULL,               // ************ (capped at 12)
    PARTIAL             // ab*****yz
};

enum class RiskLevel {
    SAFE,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class AggregationStrategy {
    TIER,
    SCORE
};

// ============================================================================
// Detection Types
// ============================================================================

/**
 * @brief Unvalidated grammar hit. Holds the raw value until masking.
 */
struct Candidate {
    CategoryId category;
    std::string label;
    Sensitivity sensitivity;
    std::string value;          // Raw matched payload (never leaves the engine)
    size_t start;               // Byte offset, inclusive
    size_t end;                 // Byte offset, exclusive
    double confidence;

    Candidate()
        : category(CategoryId::CREDIT_CARD),
          sensitivity(Sensitivity::NONE),
          start(0),
          end(0),
          confidence(0.0) {}
};

/**
 * @brief Finalized detection. Carries only the masked rendering.
 */
struct Match {
    CategoryId category;
    std::string label;
    std::string masked_text;
    Sensitivity sensitivity;
    double confidence;          // Rounded to 2 decimals
    size_t start;
    size_t end;

    Match()
        : category(CategoryId::CREDIT_CARD),
          sensitivity(Sensitivity::NONE),
          confidence(0.0),
          start(0),
          end(0) {}
};

// ============================================================================
// Report Types
// ============================================================================

// Tier view
struct ScanReport {
    bool has_sensitive_data;
    Sensitivity overall_sensitivity;
    size_t total_matches;
    std::set<CategoryId> categories;
    std::vector<Match> matches;     // Descending confidence, then ascending start
    std::string recommendation;

    ScanReport()
        : has_sensitive_data(false),
          overall_sensitivity(Sensitivity::NONE),
          total_matches(0) {}
};

struct Detection {
    std::string type;               // Descriptor label
    CategoryId category;
    std::string masked_value;
    Sensitivity sensitivity;
    std::string recommendation;     // Category recommendation

    Detection() : category(CategoryId::CREDIT_CARD), sensitivity(Sensitivity::NONE) {}
};

// Score view
struct RiskSummary {
    int risk_score;                 // 0 - 100
    RiskLevel risk_level;
    size_t total_detections;
    std::vector<Detection> detections;
    std::string message;

    RiskSummary()
        : risk_score(0),
          risk_level(RiskLevel::SAFE),
          total_detections(0) {}
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* sensitivity_to_string(Sensitivity level) {
    switch (level) {
        case Sensitivity::NONE: return "none";
        case Sensitivity::LOW: return "low";
        case Sensitivity::MEDIUM: return "medium";
        case Sensitivity::HIGH: return "high";
        case Sensitivity::CRITICAL: return "critical";
    }
    return "none";
}

inline std::optional<Sensitivity> sensitivity_from_string(std::string_view name) {
    static constexpr std::array<Sensitivity, 5> kAll = {
        Sensitivity::NONE, Sensitivity::LOW, Sensitivity::MEDIUM,
        Sensitivity::HIGH, Sensitivity::CRITICAL};
    for (const auto level : kAll) {
        if (name == sensitivity_to_string(level)) return level;
    }
    return std::nullopt;
}

inline constexpr int sensitivity_rank(Sensitivity level) noexcept {
    return static_cast<int>(level);
}

inline const char* category_to_string(CategoryId id) {
    switch (id) {
        case CategoryId::CREDIT_CARD: return "credit_card";
        case CategoryId::BANK_ACCOUNT: return "bank_account";
        case CategoryId::CVV: return "cvv";
        case CategoryId::SSN: return "ssn";
        case CategoryId::NATIONAL_ID: return "national_id";
        case CategoryId::PASSPORT: return "passport";
        case CategoryId::DRIVERS_LICENSE: return "drivers_license";
        case CategoryId::PASSWORD: return "password";
        case CategoryId::PIN: return "pin";
        case CategoryId::API_KEY: return "api_key";
        case CategoryId::PHONE: return "phone";
        case CategoryId::EMAIL: return "email";
        case CategoryId::ADDRESS: return "address";
        case CategoryId::DOB: return "dob";
        case CategoryId::MEDICAL: return "medical";
        case CategoryId::CONFIDENTIAL: return "confidential";
        case CategoryId::SALARY: return "salary";
        case CategoryId::IP_ADDRESS: return "ip_address";
    }
    return "unknown";
}

inline std::optional<CategoryId> category_from_string(std::string_view name) {
    for (size_t i = 0; i < kCategoryCount; ++i) {
        const auto id = static_cast<CategoryId>(i);
        if (name == category_to_string(id)) return id;
    }
    return std::nullopt;
}

inline const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::SAFE: return "SAFE";
        case RiskLevel::LOW: return "LOW";
        case RiskLevel::MEDIUM: return "MEDIUM";
        case RiskLevel::HIGH: return "HIGH";
        case RiskLevel::CRITICAL: return "CRITICAL";
    }
    return "SAFE";
}

inline const char* aggregation_to_string(AggregationStrategy strategy) {
    return strategy == AggregationStrategy::SCORE ? "score" : "tier";
}

} // namespace dlpscan
