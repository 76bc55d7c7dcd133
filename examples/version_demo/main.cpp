/// @file main.cpp
/// @brief Version Demo
///
/// Parses the version literals given on the command line, sorts them and
/// prints each one in its normal, numified and stringified forms.
///
/// Usage: dotver_demo [--config=FILE] [--log-level=LEVEL]
///                    [--version-warn-single-component=BOOL] LITERAL...
///
/// Options must use the --key=value form so that literals are never taken
/// as option values. Option names map to config keys (log.level,
/// version.warn_single_component).

#include <dotver/core/core.hpp>
#include <dotver/version/version_module.hpp>

#include <cstdlib>
#include <string>
#include <vector>

namespace {

/// Literals shown when none are given
const std::vector<std::string> k_default_literals = {
    "v1.2.3", "1.002003", "1.2", "v1.23", "1.23", "1.002_03", "v1.2.3_4", "0.96", "v0.95.0",
};

/// Arguments that are not options
std::vector<std::string> positional_args(int argc, char* argv[]) {
    std::vector<std::string> literals;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!arg.starts_with("--")) {
            literals.push_back(std::move(arg));
        }
    }
    return literals;
}

/// Print the three renderings of a version
void print_version(const dotver_version::Version& v) {
    DOTVER_LOG_INFO("  {:<12} normal={:<14} numify={:<12} qv={} alpha={}",
                    v.stringify(), v.normal(), v.numify(), v.is_qv(), v.is_alpha());
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    // Configuration: defaults < config file < environment < command line
    dotver_core::ConfigManager config;
    config.setup_defaults();
    config.load_environment();

    auto args_result = config.parse_args(argc, argv);
    if (!args_result) {
        DOTVER_LOG_ERROR("Invalid arguments: {}", dotver_core::build_error_chain(args_result.error()));
        return EXIT_FAILURE;
    }

    std::string config_file = config.get_string("config");
    if (!config_file.empty()) {
        auto load_result = config.load_json(config_file);
        if (!load_result) {
            DOTVER_LOG_ERROR("Failed to load config: {}", dotver_core::build_error_chain(load_result.error()));
            return EXIT_FAILURE;
        }
    }

    dotver_core::Settings settings = config.build_settings();
    dotver_core::configure_logging(settings.log_config());
    auto options = dotver_version::ParseOptions::from_settings(settings);

    DOTVER_LOG_INFO("=== Version Demo ===");

    auto literals = positional_args(argc, argv);
    if (literals.empty()) {
        literals = k_default_literals;
    }

    // Parse
    std::vector<dotver_version::Version> versions;
    for (const auto& literal : literals) {
        auto parsed = dotver_version::parse(literal, options);
        if (!parsed) {
            DOTVER_LOG_WARN("Skipping '{}': {}", literal, dotver_core::build_error_chain(parsed.error()));
            continue;
        }
        versions.push_back(std::move(*parsed));
    }

    if (versions.empty()) {
        DOTVER_LOG_ERROR("No valid version literals");
        return EXIT_FAILURE;
    }

    // Sort
    dotver_version::sort_versions(versions);

    DOTVER_LOG_INFO("=== Sorted ({}) ===", versions.size());
    for (const auto& v : versions) {
        print_version(v);
    }

    // Neighbours
    DOTVER_LOG_INFO("=== Pairwise ===");
    for (std::size_t i = 1; i < versions.size(); ++i) {
        const auto& a = versions[i - 1];
        const auto& b = versions[i];
        DOTVER_LOG_INFO("  {} {} {}", a.stringify(), a == b ? "==" : "<", b.stringify());
    }

    DOTVER_LOG_INFO("Newest: {}", versions.back().normal());

    dotver_core::flush_all_loggers();
    return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        DOTVER_LOG_ERROR("FATAL EXCEPTION: {}", e.what());
        spdlog::default_logger()->flush();
        return EXIT_FAILURE;
    }
}
