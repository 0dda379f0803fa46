//! # Run Configuration
//!
//! Settings the orchestrator consults while running examples.
//!
//! | Field                            | Default | Effect                              |
//! |----------------------------------|---------|-------------------------------------|
//! | `dry_run`                        | false   | Report examples without running them |
//! | `expecting_matcher_descriptions` | true    | Describe undescribed examples from the last expectation |
//! | `description_formatter`          | unset   | Rewrites every example description  |
//! | `descriptions`                   | global  | Where generated descriptions come from |

#ifndef EXEMPLAR_CORE_CONFIGURATION_HPP
#define EXEMPLAR_CORE_CONFIGURATION_HPP

#include "exemplar/common.hpp"
#include "exemplar/matchers/expectations.hpp"

#include <functional>
#include <string>

namespace exemplar::core {

struct Configuration {
    bool dry_run = false;

    bool expecting_matcher_descriptions = true;

    std::function<std::string(const std::string&)> description_formatter;

    /// Null means the process-wide `matchers::GeneratedDescriptions` store.
    Rc<matchers::DescriptionSource> descriptions;

    /// Applies `description_formatter`, or returns `description` unchanged.
    [[nodiscard]] auto format_description(const std::string& description) const -> std::string;

    [[nodiscard]] auto description_source() const -> matchers::DescriptionSource&;
};

/// Reads --dry-run and --no-generated-descriptions from argv, with the
/// EXEMPLAR_DRY_RUN environment variable (1/true/yes/on) as fallback.
[[nodiscard]] auto parse_run_options(int argc, char* argv[]) -> Configuration;

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_CONFIGURATION_HPP
