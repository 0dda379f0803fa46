//! # Configuration
//!
//! Description formatting and command-line parsing of run options.

#include "exemplar/core/configuration.hpp"

#include "exemplar/log/log.hpp"

#include <cctype>
#include <cstdlib>

namespace exemplar::core {

std::string Configuration::format_description(const std::string& description) const {
    if (!description_formatter)
        return description;
    return description_formatter(description);
}

matchers::DescriptionSource& Configuration::description_source() const {
    if (descriptions)
        return *descriptions;
    return *matchers::GeneratedDescriptions::global();
}

static bool parse_flag(const std::string& value) {
    std::string lower;
    for (unsigned char c : value)
        lower.push_back(static_cast<char>(std::tolower(c)));
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

Configuration parse_run_options(int argc, char* argv[]) {
    Configuration config;
    bool has_cli_dry_run = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            config.dry_run = true;
            has_cli_dry_run = true;
        } else if (arg == "--no-generated-descriptions") {
            config.expecting_matcher_descriptions = false;
        }
    }

    if (!has_cli_dry_run) {
        const char* env = std::getenv("EXEMPLAR_DRY_RUN");
        if (env && parse_flag(env))
            config.dry_run = true;
    }

    EXEMPLAR_LOG_DEBUG("config", "dry_run=" << config.dry_run << " generated_descriptions="
                                            << config.expecting_matcher_descriptions);
    return config;
}

} // namespace exemplar::core
