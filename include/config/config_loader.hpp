#pragma once

#include "catalog/pattern_catalog.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dlpscan {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Engine Config
// ============================================================================

struct EngineConfig {
    std::string aggregation = "tier";
    double min_confidence = 0.0;
    std::vector<std::string> disabled_categories;
};

// ============================================================================
// Custom Pattern Config ([[patterns]])
// ============================================================================

struct PatternConfig {
    std::string category;
    std::string label;
    std::string grammar;
    std::string sensitivity;
    double confidence = 0.0;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct DlpConfig {
    LoggingConfig logging;
    EngineConfig engine;
    std::vector<PatternConfig> patterns;

    /**
     * @brief Resolve names into a catalog build request.
     * Only valid on a config that passed validation.
     */
    [[nodiscard]] CatalogConfig catalog_config() const;

    [[nodiscard]] AggregationStrategy aggregation_strategy() const;
};

/**
 * @brief TOML configuration loader (toml++)
 *
 * Supports:
 * - `include = ["other.toml"]`: deep-merged into the including file, cycles
 *   rejected. Tables merge key by key and the including file's scalars win;
 *   arrays are concatenated, included entries first, so included
 *   [[patterns]] and disabled_categories add to the main file's.
 * - `${VAR}` environment substitution inside any string value
 * - [logging], [engine] and [[patterns]] sections
 *
 * Every problem found (wrongly typed entries, unknown names, out-of-range
 * values) is reported together in one error message.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        DlpConfig config;

        static LoadResult ok(DlpConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from TOML file
     * @param config_path Path to dlpscan.toml
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML string (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR_NAME} references from the environment.
     * Unset variables expand to "".
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

    [[nodiscard]] static std::vector<std::string> validate_config(const DlpConfig& config);

    static std::optional<AggregationStrategy> parse_aggregation(const std::string& name);
};

} // namespace dlpscan
