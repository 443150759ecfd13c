#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace dlpscan {

namespace {

namespace fs = std::filesystem;

constexpr int kMaxIncludeDepth = 10;
constexpr double kDefaultPatternConfidence = 0.8;

// ============================================================================
// Environment substitution
// ============================================================================

// Rewrites every string value below node, at any depth
void expand_env_in_place(toml::node& node) {
    node.visit([](auto& n) {
        using node_type = decltype(n);
        if constexpr (toml::is_string<node_type>) {
            n = ConfigLoader::expand_env_vars(n.get());
        } else if constexpr (toml::is_table<node_type>) {
            for (auto&& [key, child] : n) expand_env_in_place(child);
        } else if constexpr (toml::is_array<node_type>) {
            for (auto& child : n) expand_env_in_place(child);
        }
    });
}

// ============================================================================
// Includes
// ============================================================================

/**
 * @brief Lays `top` over `base`: tables merge key by key, arrays append
 * (base entries first), anything else in `top` replaces the base value.
 */
void overlay_onto(toml::table& base, const toml::table& top) {
    for (const auto& [key, node] : top) {
        toml::node* existing = base.get(key.str());
        if (existing && existing->is_table() && node.is_table()) {
            overlay_onto(*existing->as_table(), *node.as_table());
        } else if (existing && existing->is_array() && node.is_array()) {
            auto& target = *existing->as_array();
            for (const auto& entry : *node.as_array()) {
                target.push_back(entry);
            }
        } else {
            base.insert_or_assign(key, node);
        }
    }
}

std::vector<std::string> take_include_list(toml::table& root) {
    std::vector<std::string> files;
    const toml::node* node = root.get("include");
    if (!node) return files;

    if (const auto* single = node->as_string()) {
        files.push_back(single->get());
    } else if (const auto* list = node->as_array()) {
        for (const auto& entry : *list) {
            const auto* name = entry.as_string();
            if (!name) {
                throw std::runtime_error("include entries must be strings");
            }
            files.push_back(name->get());
        }
    } else {
        throw std::runtime_error("include must be a string or an array of strings");
    }

    root.erase("include");
    return files;
}

/**
 * @brief Loads a config file and everything it includes.
 *
 * Include paths are relative to the including file. A file may be included
 * from several places, but never from inside its own include chain.
 */
class IncludeResolver {
public:
    toml::table load(const fs::path& file) {
        if (chain_.size() > static_cast<size_t>(kMaxIncludeDepth)) {
            throw std::runtime_error(
                std::format("Config include depth exceeds {}", kMaxIncludeDepth));
        }

        const std::string canonical = fs::canonical(file).string();
        if (std::find(chain_.begin(), chain_.end(), canonical) != chain_.end()) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", canonical));
        }
        chain_.push_back(canonical);

        toml::table root = toml::parse_file(canonical);
        const fs::path dir = fs::path(canonical).parent_path();

        for (const auto& name : take_include_list(root)) {
            toml::table merged = load(dir / name);
            overlay_onto(merged, root);
            root = std::move(merged);
        }

        chain_.pop_back();
        return root;
    }

private:
    std::vector<std::string> chain_;
};

// ============================================================================
// Section readers
// ============================================================================

std::string read_string(const toml::table& section, std::string_view key, std::string fallback) {
    return section[key].value_or(std::move(fallback));
}

// Integer and float nodes are both accepted
double read_number(const toml::table& section, std::string_view key, double fallback) {
    const auto node = section[key];
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* i = node.as_integer()) return static_cast<double>(i->get());
    return fallback;
}

// Shape errors are collected in `problems` under the dotted key `path`
std::vector<std::string> read_names(const toml::table& section, std::string_view key,
                                    std::string_view path, std::vector<std::string>& problems) {
    std::vector<std::string> names;
    const auto node = section[key];
    if (!node) return names;

    const auto* list = node.as_array();
    if (!list) {
        problems.push_back(std::format("{} must be an array of strings", path));
        return names;
    }

    for (size_t i = 0; i < list->size(); ++i) {
        const auto* name = (*list)[i].as_string();
        if (!name) {
            problems.push_back(std::format("{}[{}] must be a string", path, i));
            continue;
        }
        names.push_back(utils::to_lower(name->get()));
    }
    return names;
}

DlpConfig read_config(const toml::table& root, std::vector<std::string>& problems) {
    DlpConfig config;

    if (const auto* logging = root["logging"].as_table()) {
        config.logging.level = read_string(*logging, "level", config.logging.level);
    }

    if (const auto* engine = root["engine"].as_table()) {
        config.engine.aggregation =
            utils::to_lower(read_string(*engine, "aggregation", config.engine.aggregation));
        config.engine.min_confidence =
            read_number(*engine, "min_confidence", config.engine.min_confidence);
        config.engine.disabled_categories = read_names(
            *engine, "disabled_categories", "engine.disabled_categories", problems);
    }

    if (const auto* patterns = root["patterns"].as_array()) {
        config.patterns.reserve(patterns->size());
        for (size_t i = 0; i < patterns->size(); ++i) {
            const auto* table = (*patterns)[i].as_table();
            if (!table) {
                problems.push_back(std::format("patterns[{}] must be a table", i));
                continue;
            }
            const toml::table& entry = *table;

            PatternConfig pattern;
            pattern.category = utils::to_lower(read_string(entry, "category", ""));
            pattern.label = read_string(entry, "label", "");
            pattern.grammar = read_string(entry, "grammar", "");
            pattern.sensitivity = utils::to_lower(read_string(entry, "sensitivity", ""));
            pattern.confidence = read_number(entry, "confidence", kDefaultPatternConfidence);
            config.patterns.push_back(std::move(pattern));
        }
    }

    return config;
}

// Parse, substitute, read and validate; any failure becomes an error result
template <typename ParseFn>
ConfigLoader::LoadResult load_with(ParseFn&& parse, std::string_view failure) {
    DlpConfig config;
    std::vector<std::string> problems;
    try {
        toml::table root = parse();
        expand_env_in_place(root);
        config = read_config(root, problems);
    } catch (const std::exception& e) {
        return ConfigLoader::LoadResult::error(std::format("{}: {}", failure, e.what()));
    }

    for (auto& problem : ConfigLoader::validate_config(config)) {
        problems.push_back(std::move(problem));
    }
    if (problems.empty()) {
        return ConfigLoader::LoadResult::ok(std::move(config));
    }

    std::string message = "Config validation failed:";
    for (const auto& problem : problems) {
        message += std::format("\n  - {}", problem);
    }
    return ConfigLoader::LoadResult::error(std::move(message));
}

} // anonymous namespace

// ============================================================================
// DlpConfig
// ============================================================================

CatalogConfig DlpConfig::catalog_config() const {
    CatalogConfig cfg;
    for (const auto& name : engine.disabled_categories) {
        if (const auto id = category_from_string(name)) {
            cfg.disabled_categories.push_back(*id);
        }
    }
    for (const auto& p : patterns) {
        const auto id = category_from_string(p.category);
        const auto level = sensitivity_from_string(p.sensitivity);
        if (!id || !level) continue;
        cfg.custom_patterns.emplace_back(*id, p.label, p.grammar, *level, p.confidence);
    }
    return cfg;
}

AggregationStrategy DlpConfig::aggregation_strategy() const {
    return ConfigLoader::parse_aggregation(engine.aggregation).value_or(AggregationStrategy::TIER);
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            out.append(input, pos, std::string::npos);
            return out;
        }

        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unterminated ${{...}} reference at offset {}", open));
        }

        out.append(input, pos, open - pos);
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
}

std::optional<AggregationStrategy> ConfigLoader::parse_aggregation(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "tier") return AggregationStrategy::TIER;
    if (lower == "score") return AggregationStrategy::SCORE;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    return load_with([&config_path] { return IncludeResolver{}.load(config_path); },
                     "Failed to load config");
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    return load_with([&toml_content] { return toml::parse(toml_content); },
                     "Failed to parse config");
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DlpConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::level_from_string(config.logging.level)) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
            config.logging.level));
    }

    if (!parse_aggregation(config.engine.aggregation)) {
        errors.push_back(std::format("engine.aggregation must be 'tier' or 'score', got '{}'",
            config.engine.aggregation));
    }

    if (config.engine.min_confidence < 0.0 || config.engine.min_confidence > 1.0) {
        errors.push_back(std::format("engine.min_confidence must be within [0, 1], got {}",
            config.engine.min_confidence));
    }

    for (const auto& name : config.engine.disabled_categories) {
        if (!category_from_string(name)) {
            errors.push_back(std::format("engine.disabled_categories: unknown category '{}'", name));
        }
    }

    for (size_t i = 0; i < config.patterns.size(); ++i) {
        const auto& p = config.patterns[i];
        if (!category_from_string(p.category)) {
            errors.push_back(std::format("patterns[{}].category: unknown category '{}'", i, p.category));
        }
        if (p.label.empty()) {
            errors.push_back(std::format("patterns[{}].label must not be empty", i));
        }
        if (p.grammar.empty()) {
            errors.push_back(std::format("patterns[{}].grammar must not be empty", i));
        }
        const auto level = sensitivity_from_string(p.sensitivity);
        if (!level || *level == Sensitivity::NONE) {
            errors.push_back(std::format(
                "patterns[{}].sensitivity must be low, medium, high or critical, got '{}'",
                i, p.sensitivity));
        }
        if (p.confidence < 0.0 || p.confidence > 1.0) {
            errors.push_back(std::format("patterns[{}].confidence must be within [0, 1], got {}",
                i, p.confidence));
        }
    }

    return errors;
}

} // namespace dlpscan
