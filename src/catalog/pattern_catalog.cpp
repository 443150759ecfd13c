#include "catalog/pattern_catalog.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>
#include <stdexcept>

namespace dlpscan {

namespace {

// Upper bound on compiled program memory per grammar
constexpr int64_t kMaxRegexMemory = 8 << 20;

using S = Sensitivity;
using C = CategoryId;

/**
 * @brief Built-in grammars.
 *
 * All grammars are matched case-insensitively. Keyword-anchored grammars
 * put the sensitive payload in group 1 and use (?:...) everywhere else.
 */
const std::vector<PatternSpec>& builtin_table() {
    static const std::vector<PatternSpec> table = {
        // ============== FINANCIAL ==============
        {C::CREDIT_CARD, "Visa card",
         R"(\b4[0-9]{3}[-\s]?[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}\b)", S::CRITICAL, 0.95},
        {C::CREDIT_CARD, "MasterCard",
         R"(\b5[1-5][0-9]{2}[-\s]?[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}\b)", S::CRITICAL, 0.95},
        {C::CREDIT_CARD, "American Express",
         R"(\b3[47][0-9]{2}[-\s]?[0-9]{6}[-\s]?[0-9]{5}\b)", S::CRITICAL, 0.95},
        {C::CREDIT_CARD, "Discover card",
         R"(\b6(?:011|5[0-9]{2})[-\s]?[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}\b)", S::CRITICAL, 0.95},
        {C::CREDIT_CARD, "Credit card number",
         R"(\b[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}[-\s]?[0-9]{4}\b)", S::CRITICAL, 0.70},

        {C::BANK_ACCOUNT, "IBAN",
         R"(\b[A-Z]{2}[0-9]{2}[A-Z0-9]{4}[0-9]{7}[A-Z0-9]{0,16}\b)", S::HIGH, 0.95},
        {C::BANK_ACCOUNT, "Bank account number",
         R"(\b(?:account|acct|a/c)(?:\s*(?:number|num|no\.?))?[\s:#]*([0-9]{8,17})\b)", S::HIGH, 0.85},
        {C::BANK_ACCOUNT, "Bank routing number",
         R"(\b(?:routing|rtg|aba)(?:\s*(?:number|num|no\.?))?[\s:#]*([0-9]{9})\b)", S::HIGH, 0.90},
        {C::BANK_ACCOUNT, "SWIFT/BIC code",
         R"(\b(?:swift|bic)(?:\s*code\s*[:#]?|\s*[:#])\s*([A-Z]{6}[A-Z0-9]{2}(?:[A-Z0-9]{3})?)\b)", S::HIGH, 0.80},

        {C::CVV, "Card security code (CVV)",
         R"(\b(?:cvv2?|cvc2?|security\s*code)[\s:]*([0-9]{3,4})\b)", S::CRITICAL, 0.95},

        // ============== IDENTITY ==============
        {C::SSN, "Social Security Number",
         R"(\b[0-9]{3}[-\s][0-9]{2}[-\s][0-9]{4}\b)", S::CRITICAL, 0.95},
        {C::SSN, "SSN",
         R"(\b(?:ssn|social\s*security(?:\s*(?:number|no\.?))?)[\s:#]*([0-9]{3}[-\s]?[0-9]{2}[-\s]?[0-9]{4})\b)", S::CRITICAL, 0.98},

        {C::NATIONAL_ID, "Singapore NRIC/FIN",
         R"(\b[STFGM][0-9]{7}[A-Z]\b)", S::CRITICAL, 0.95},
        {C::NATIONAL_ID, "Malaysia IC",
         R"(\b[0-9]{6}[-\s]?[0-9]{2}[-\s]?[0-9]{4}\b)", S::CRITICAL, 0.80},
        {C::NATIONAL_ID, "Sri Lankan National ID (old format)",
         R"(\b[0-9]{9}[VX]\b)", S::HIGH, 0.90},
        {C::NATIONAL_ID, "Sri Lankan National ID (new format)",
         R"(\b(?:19|20)[0-9]{10}\b)", S::HIGH, 0.85},

        {C::PASSPORT, "Passport number",
         R"(\bpassport(?:\s*(?:number|no\.?))?[\s:#]*([A-Z]{1,2}[0-9]{6,9})\b)", S::HIGH, 0.85},

        {C::DRIVERS_LICENSE, "Driver's license",
         R"(\b(?:driver'?s?\s*licen[cs]e(?:\s*(?:number|no\.?))?|dl|licen[cs]e\s*#?)[\s:#]*([A-Z0-9]{5,15})\b)", S::HIGH, 0.80},

        // ============== AUTHENTICATION ==============
        {C::PASSWORD, "Password",
         R"(\bpassword[\s:=]+(\S+))", S::CRITICAL, 0.95},
        {C::PASSWORD, "Password",
         R"(\b(?:pwd|passwd)[\s:=]+(\S+))", S::CRITICAL, 0.90},
        {C::PASSWORD, "Password",
         R"(\bpass[\s:=]+(\S{6,}))", S::CRITICAL, 0.80},

        {C::PIN, "PIN code",
         R"(\bpin(?:\s*(?:code|number))?[\s:=]+([0-9]{4,6})\b)", S::CRITICAL, 0.95},

        {C::API_KEY, "API Key",
         R"(\bapi[_\s-]?key[\s:=]+([A-Z0-9_\-]{20,}))", S::CRITICAL, 0.95},
        {C::API_KEY, "Secret Key",
         R"(\bsecret[_\s-]?key[\s:=]+([A-Z0-9_\-]{20,}))", S::CRITICAL, 0.95},
        {C::API_KEY, "Access Token",
         R"(\baccess[_\s-]?token[\s:=]+([A-Z0-9_\-]{20,}))", S::CRITICAL, 0.95},
        {C::API_KEY, "Bearer Token",
         R"(\bbearer\s+([A-Z0-9_\-.]{20,}))", S::CRITICAL, 0.90},
        {C::API_KEY, "AWS Access Key",
         R"(\bAKIA[0-9A-Z]{16}\b)", S::CRITICAL, 0.98},
        {C::API_KEY, "Google API Key",
         R"(\bAIza[0-9A-Z_\-]{35}\b)", S::CRITICAL, 0.95},
        {C::API_KEY, "GitHub Token",
         R"(\bgh[pousr]_[0-9A-Z]{36}\b)", S::CRITICAL, 0.95},

        // ============== PERSONAL ==============
        {C::PHONE, "Phone number (international)",
         R"(\+[1-9][0-9]{0,2}[-\s]?[0-9]{8,14}\b)", S::MEDIUM, 0.85},
        {C::PHONE, "Phone number (US)",
         R"(\b\(?[0-9]{3}\)?[-.\s]?[0-9]{3}[-.\s]?[0-9]{4}\b)", S::MEDIUM, 0.80},
        {C::PHONE, "Phone number (local)",
         R"(\b0[0-9]{9}\b)", S::MEDIUM, 0.85},
        {C::PHONE, "Phone number",
         R"(\b(?:phone|mobile|cell|tel)(?:\s*(?:number|no\.?))?[\s:#]*([0-9][0-9\- ]{8,}[0-9]))", S::MEDIUM, 0.85},

        {C::EMAIL, "Email address",
         R"(\b[A-Z0-9._%+-]+@[A-Z0-9.-]+\.[A-Z]{2,}\b)", S::LOW, 0.95},

        {C::ADDRESS, "Physical address",
         R"(\b(?:address|street|avenue|road|blvd|lane)[\s:#]*([0-9]{1,6}\s+[A-Z](?:[A-Z ]{0,60}[A-Z])?))", S::MEDIUM, 0.70},

        {C::DOB, "Date of birth",
         R"(\b(?:dob|date\s*of\s*birth|born(?:\s*on)?|birthday)[\s:]+([0-9]{1,2}[/\-][0-9]{1,2}[/\-][0-9]{2,4})\b)", S::MEDIUM, 0.90},

        // ============== MEDICAL ==============
        {C::MEDICAL, "Medical record number",
         R"(\b(?:mrn|medical\s*record(?:\s*(?:number|no\.?))?|patient\s*id)[\s:#]*([A-Z0-9]{6,}))", S::HIGH, 0.90},
        {C::MEDICAL, "Health information",
         R"(\b(?:diagnosis|diagnosed\s*with|prescription|medication)[\s:]+([A-Z](?:[A-Z ]{0,60}[A-Z])?))", S::HIGH, 0.70},
        {C::MEDICAL, "Medical condition",
         R"(\b(?:hiv|aids|cancer|diabetes|chemotherapy|psychiatric|mental\s*health)\b)", S::HIGH, 0.60},

        // ============== CORPORATE ==============
        {C::CONFIDENTIAL, "Confidential content marker",
         R"(\b(?:confidential|classified|top\s*secret|strictly\s*private|internal\s*use\s*only|proprietary|do\s*not\s*(?:share|forward|distribute))\b)", S::HIGH, 0.75},

        {C::SALARY, "Salary figure",
         R"(\b(?:salary|salaries|compensation|wages?|payroll|pay\s*slip|income)\b[^0-9\n]{0,30}((?:rs\.?|lkr|usd|inr|\$|€|£)\s?[0-9][0-9,]*(?:\.[0-9]{1,2})?))", S::HIGH, 0.85},
        {C::SALARY, "Compensation figure",
         R"(((?:rs\.?|lkr|usd|inr|\$|€|£)\s?[0-9][0-9,]*(?:\.[0-9]{1,2})?)\s*(?:per\s*(?:month|annum|year)|/\s*(?:month|year|yr|mo)\b|monthly|annually))", S::HIGH, 0.70},

        // ============== NETWORK ==============
        {C::IP_ADDRESS, "IP Address (IPv4)",
         R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)", S::MEDIUM, 0.90},
        {C::IP_ADDRESS, "IP Address (IPv6)",
         R"(\b(?:[0-9A-F]{1,4}:){7}[0-9A-F]{1,4}\b)", S::MEDIUM, 0.90},
    };
    return table;
}

} // anonymous namespace

// ============================================================================
// Static tables
// ============================================================================

const std::vector<PatternSpec>& PatternCatalog::builtin_patterns() {
    return builtin_table();
}

Sensitivity PatternCatalog::category_sensitivity(CategoryId id) {
    switch (id) {
        case CategoryId::CREDIT_CARD:
        case CategoryId::CVV:
        case CategoryId::SSN:
        case CategoryId::NATIONAL_ID:
        case CategoryId::PASSWORD:
        case CategoryId::PIN:
        case CategoryId::API_KEY:
            return Sensitivity::CRITICAL;
        case CategoryId::BANK_ACCOUNT:
        case CategoryId::PASSPORT:
        case CategoryId::DRIVERS_LICENSE:
        case CategoryId::MEDICAL:
        case CategoryId::CONFIDENTIAL:
        case CategoryId::SALARY:
            return Sensitivity::HIGH;
        case CategoryId::PHONE:
        case CategoryId::ADDRESS:
        case CategoryId::DOB:
        case CategoryId::IP_ADDRESS:
            return Sensitivity::MEDIUM;
        case CategoryId::EMAIL:
            return Sensitivity::LOW;
    }
    return Sensitivity::NONE;
}

const char* PatternCatalog::category_recommendation(CategoryId id) {
    switch (id) {
        case CategoryId::CREDIT_CARD:
            return "Never share full card numbers. Use a secure payment link instead.";
        case CategoryId::BANK_ACCOUNT:
            return "Share bank details only through your bank's verified channels.";
        case CategoryId::CVV:
            return "Card security codes must never be shared with anyone.";
        case CategoryId::SSN:
            return "Social Security Numbers enable identity theft. Do not send.";
        case CategoryId::NATIONAL_ID:
            return "National ID numbers should only go to verified official services.";
        case CategoryId::PASSPORT:
            return "Send passport details only to verified travel or government services.";
        case CategoryId::DRIVERS_LICENSE:
            return "Driver's license numbers can be used for identity fraud.";
        case CategoryId::PASSWORD:
            return "Never send passwords in messages. Change this password if it was sent.";
        case CategoryId::PIN:
            return "PIN codes must never be shared. Banks will never ask for them.";
        case CategoryId::API_KEY:
            return "Revoke and rotate this credential; use a secrets manager to share access.";
        case CategoryId::PHONE:
            return "Confirm the recipient should have this phone number.";
        case CategoryId::EMAIL:
            return "Email addresses are low risk but can attract spam or phishing.";
        case CategoryId::ADDRESS:
            return "Physical addresses reveal your location. Share with trusted contacts only.";
        case CategoryId::DOB:
            return "Dates of birth are often used for identity verification.";
        case CategoryId::MEDICAL:
            return "Health information is protected data. Use a secure, approved channel.";
        case CategoryId::CONFIDENTIAL:
            return "Content is marked confidential. Check it may leave the organization.";
        case CategoryId::SALARY:
            return "Compensation details are confidential. Share only with authorized people.";
        case CategoryId::IP_ADDRESS:
            return "Internal network addresses can help attackers map infrastructure.";
    }
    return "";
}

// ============================================================================
// Build
// ============================================================================

Result<PatternDescriptor> PatternCatalog::compile(const PatternSpec& def) {
    if (def.grammar.empty()) {
        return Result<PatternDescriptor>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Pattern '{}' has an empty grammar", def.label));
    }
    if (def.confidence < 0.0 || def.confidence > 1.0) {
        return Result<PatternDescriptor>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Pattern '{}' confidence {} outside [0, 1]", def.label, def.confidence));
    }
    if (def.sensitivity == Sensitivity::NONE) {
        return Result<PatternDescriptor>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Pattern '{}' must have a sensitivity above none", def.label));
    }

    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    options.set_max_mem(kMaxRegexMemory);

    auto regex = std::make_unique<const re2::RE2>(def.grammar, options);
    if (!regex->ok()) {
        return Result<PatternDescriptor>::error(ErrorCategory::CATALOG_ERROR,
            std::format("Pattern '{}' ({}) failed to compile: {}",
                def.label, category_to_string(def.category), regex->error()));
    }

    PatternDescriptor descriptor;
    descriptor.grammar = def.grammar;
    descriptor.label = def.label;
    descriptor.sensitivity = def.sensitivity;
    descriptor.base_confidence = def.confidence;
    descriptor.regex = std::move(regex);
    return Result<PatternDescriptor>::ok(std::move(descriptor));
}

Result<PatternCatalog::Ptr> PatternCatalog::build(const CatalogConfig& config) {
    std::array<bool, kCategoryCount> disabled{};
    for (const auto id : config.disabled_categories) {
        disabled[static_cast<size_t>(id)] = true;
    }

    // Private constructor: no make_shared
    std::shared_ptr<PatternCatalog> catalog(new PatternCatalog());
    catalog->categories_.reserve(kCategoryCount);

    for (size_t i = 0; i < kCategoryCount; ++i) {
        if (disabled[i]) continue;
        const auto id = static_cast<CategoryId>(i);

        Category category;
        category.id = id;
        category.default_sensitivity = category_sensitivity(id);
        category.mask_policy = MaskingEngine::policy_for(id);
        category.recommendation = category_recommendation(id);

        catalog->index_[i] = static_cast<int>(catalog->categories_.size());
        catalog->categories_.emplace_back(std::move(category));
    }

    auto add_all = [&](const std::vector<PatternSpec>& defs) -> std::optional<std::string> {
        for (const auto& def : defs) {
            const int slot = catalog->index_[static_cast<size_t>(def.category)];
            if (slot < 0) continue;

            auto compiled = compile(def);
            if (compiled.is_error()) {
                return compiled.error_message();
            }
            catalog->categories_[static_cast<size_t>(slot)].patterns.emplace_back(
                std::move(compiled.value()));
        }
        return std::nullopt;
    };

    if (auto err = add_all(builtin_table())) {
        utils::log::error(std::format("Built-in catalog rejected: {}", *err));
        return Result<Ptr>::error(ErrorCategory::CATALOG_ERROR, std::move(*err));
    }
    if (auto err = add_all(config.custom_patterns)) {
        utils::log::error(std::format("Custom pattern rejected: {}", *err));
        return Result<Ptr>::error(ErrorCategory::CATALOG_ERROR, std::move(*err));
    }

    utils::log::debug(std::format("Pattern catalog built: {} categories, {} patterns",
        catalog->category_count(), catalog->pattern_count()));

    return Result<Ptr>::ok(std::move(catalog));
}

PatternCatalog::Ptr PatternCatalog::build_default() {
    auto result = build();
    if (result.is_error()) {
        throw std::runtime_error(result.error_message());
    }
    return result.value();
}

// ============================================================================
// Lookup
// ============================================================================

const Category* PatternCatalog::find(CategoryId id) const {
    const int slot = index_[static_cast<size_t>(id)];
    return slot < 0 ? nullptr : &categories_[static_cast<size_t>(slot)];
}

size_t PatternCatalog::pattern_count() const {
    size_t count = 0;
    for (const auto& category : categories_) {
        count += category.patterns.size();
    }
    return count;
}

} // namespace dlpscan
