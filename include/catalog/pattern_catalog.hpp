#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <re2/re2.h>

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dlpscan {

/**
 * @brief Uncompiled grammar definition (built-in table or [[patterns]] config)
 */
struct PatternSpec {
    CategoryId category;
    std::string label;
    std::string grammar;
    Sensitivity sensitivity;
    double confidence;

    PatternSpec()
        : category(CategoryId::CREDIT_CARD),
          sensitivity(Sensitivity::NONE),
          confidence(0.0) {}

    PatternSpec(CategoryId c, std::string l, std::string g, Sensitivity s, double conf)
        : category(c), label(std::move(l)), grammar(std::move(g)),
          sensitivity(s), confidence(conf) {}
};

/**
 * @brief One compiled catalog entry. Immutable once built.
 *
 * A grammar with a capturing group reports group 1 (the payload) as the
 * match span; a grammar without one reports the whole match.
 */
struct PatternDescriptor {
    std::string grammar;
    std::string label;
    Sensitivity sensitivity;
    double base_confidence;
    std::unique_ptr<const re2::RE2> regex;

    [[nodiscard]] bool captures_payload() const {
        return regex && regex->NumberOfCapturingGroups() > 0;
    }
};

struct Category {
    CategoryId id;
    Sensitivity default_sensitivity;
    MaskPolicy mask_policy;
    std::string recommendation;
    std::vector<PatternDescriptor> patterns;    // Evaluated independently, in order

    [[nodiscard]] const char* name() const { return category_to_string(id); }
};

struct CatalogConfig {
    std::vector<CategoryId> disabled_categories;
    std::vector<PatternSpec> custom_patterns;   // Appended after built-ins
};

/**
 * @brief Immutable registry of sensitive-data grammars, grouped by category
 *
 * Built once, then shared read-only (std::shared_ptr<const PatternCatalog>)
 * between any number of concurrent scans. Grammars are compiled with RE2,
 * which matches in time linear in the input for every pattern.
 */
class PatternCatalog {
public:
    using Ptr = std::shared_ptr<const PatternCatalog>;

    /**
     * @brief Build the built-in catalog, minus disabled categories, plus
     * custom patterns.
     * @return Catalog, or CATALOG_ERROR naming the grammar that failed to compile
     */
    [[nodiscard]] static Result<Ptr> build(const CatalogConfig& config = {});

    /**
     * @brief Build the built-in catalog
     * @throws std::runtime_error if a built-in grammar fails to compile
     */
    [[nodiscard]] static Ptr build_default();

    /**
     * @brief Built-in grammar table, in evaluation order
     */
    [[nodiscard]] static const std::vector<PatternSpec>& builtin_patterns();

    /**
     * @brief Category default tier (summary classification)
     */
    [[nodiscard]] static Sensitivity category_sensitivity(CategoryId id);

    /**
     * @brief Per-category advice shown with score-view detections
     */
    [[nodiscard]] static const char* category_recommendation(CategoryId id);

    [[nodiscard]] const Category* find(CategoryId id) const;
    [[nodiscard]] const std::vector<Category>& categories() const { return categories_; }
    [[nodiscard]] size_t category_count() const { return categories_.size(); }
    [[nodiscard]] size_t pattern_count() const;

    PatternCatalog(const PatternCatalog&) = delete;
    PatternCatalog& operator=(const PatternCatalog&) = delete;

private:
    PatternCatalog() { index_.fill(-1); }

    static Result<PatternDescriptor> compile(const PatternSpec& def);

    std::vector<Category> categories_;              // Ascending CategoryId
    std::array<int, kCategoryCount> index_;         // CategoryId -> categories_ slot
};

} // namespace dlpscan
