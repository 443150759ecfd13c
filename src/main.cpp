#include "catalog/pattern_catalog.hpp"
#include "config/config_loader.hpp"
#include "core/detection_engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "report/report_serializer.hpp"
#include "report/request_handler.hpp"

#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace dlpscan;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUnavailable = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<AggregationStrategy> aggregation;
    std::optional<std::string> log_level;
    bool jsonl = false;
    bool list_patterns = false;
    bool help = false;
    std::vector<std::string> text;
};

void print_usage(std::ostream& out) {
    out << "Usage:\n"
           "  dlpscan [--config FILE] [--score|--tier] TEXT...\n"
           "  dlpscan [--config FILE] [--score|--tier] --jsonl < requests.jsonl\n"
           "  dlpscan [--config FILE] --list-patterns\n"
           "\n"
           "Options:\n"
           "  --config FILE       TOML configuration (see config/dlpscan.toml)\n"
           "  --score             Emit the 0-100 risk score view\n"
           "  --tier              Emit the sensitivity tier view (default)\n"
           "  --jsonl             Read {\"text\", \"source\", \"direction\"} lines from stdin\n"
           "  --list-patterns     Print the pattern catalog\n"
           "  --log-level LEVEL   debug | info | warn | error\n"
           "  -h, --help          Show this help\n";
}

// Returns an error message on bad usage
std::optional<std::string> parse_args(int argc, char* argv[], CliOptions& opts) {
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (options_done || arg.empty() || arg[0] != '-') {
            opts.text.emplace_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argc) {
                return std::format("{} requires an argument", arg);
            }
            if (arg == "--config") {
                opts.config_file = argv[++i];
            } else {
                opts.log_level = argv[++i];
            }
        } else if (arg == "--score") {
            opts.aggregation = AggregationStrategy::SCORE;
        } else if (arg == "--tier") {
            opts.aggregation = AggregationStrategy::TIER;
        } else if (arg == "--jsonl") {
            opts.jsonl = true;
        } else if (arg == "--list-patterns") {
            opts.list_patterns = true;
        } else {
            return std::format("unknown option: {}", arg);
        }
    }

    if (opts.help) return std::nullopt;
    if (opts.jsonl && opts.list_patterns) {
        return "--jsonl and --list-patterns are mutually exclusive";
    }
    if ((opts.jsonl || opts.list_patterns) && !opts.text.empty()) {
        return "TEXT arguments cannot be combined with --jsonl or --list-patterns";
    }
    if (!opts.jsonl && !opts.list_patterns && opts.text.empty()) {
        return "no text to scan";
    }
    return std::nullopt;
}

std::string join_text(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) joined += ' ';
        joined += part;
    }
    return joined;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (const auto usage_error = parse_args(argc, argv, opts)) {
        std::cerr << "dlpscan: " << *usage_error << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (opts.help) {
        print_usage(std::cout);
        return kExitOk;
    }

    try {
        // Configuration
        DlpConfig config;
        if (opts.config_file) {
            auto config_result = ConfigLoader::load_from_file(*opts.config_file);
            if (!config_result.success) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(ErrorCategory::CONFIG_ERROR),
                    config_result.error_message));
                return kExitUnavailable;
            }
            config = std::move(config_result.config);
        }

        const std::string level_name = opts.log_level.value_or(config.logging.level);
        const auto level = utils::log::level_from_string(level_name);
        if (!level) {
            std::cerr << std::format("dlpscan: unknown log level: {}\n", level_name);
            return kExitUsage;
        }
        utils::log::set_level(*level);

        if (opts.config_file) {
            utils::log::info(std::format("Config loaded from {}: {} custom patterns, {} disabled categories",
                *opts.config_file, config.patterns.size(), config.engine.disabled_categories.size()));
        }

        const AggregationStrategy aggregation =
            opts.aggregation.value_or(config.aggregation_strategy());

        // Pattern catalog
        auto catalog_result = PatternCatalog::build(config.catalog_config());
        if (catalog_result.is_error()) {
            utils::log::error(std::format("{}: detection engine unavailable: {}",
                error_category_to_string(catalog_result.error_category()),
                catalog_result.error_message()));
            return kExitUnavailable;
        }
        const auto& catalog = catalog_result.value();
        utils::log::debug(std::format("Pattern catalog: {} categories, {} patterns",
            catalog->category_count(), catalog->pattern_count()));

        if (opts.list_patterns) {
            std::cout << ReportSerializer::catalog_to_json(*catalog) << "\n";
            return kExitOk;
        }

        const DetectionEngine engine(catalog, config.engine.min_confidence);
        utils::log::debug(std::format("Detection engine ready (aggregation={}, min_confidence={:.2f})",
            aggregation_to_string(aggregation), engine.min_confidence()));

        const RequestHandler handler(engine, aggregation);

        if (opts.jsonl) {
            size_t processed = 0;
            std::string line;
            while (std::getline(std::cin, line)) {
                if (utils::trim(line).empty()) continue;
                std::cout << handler.handle_line(line) << "\n";
                ++processed;
            }
            utils::log::debug(std::format("Processed {} request lines", processed));
            return kExitOk;
        }

        const std::string text = join_text(opts.text);
        std::cout << handler.render(engine.detect(text)) << "\n";

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitUnavailable;
    }

    return kExitOk;
}
