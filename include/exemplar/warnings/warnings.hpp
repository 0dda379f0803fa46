//! # Warnings
//!
//! Deprecation notices and warnings raised while examples run.
//!
//! Deprecations go to the reporter's deprecation channel. Plain warnings go
//! through a replaceable handler, which logs under the `warnings` module by
//! default, optionally tagged with the location of the example that raised
//! them.

#ifndef EXEMPLAR_WARNINGS_WARNINGS_HPP
#define EXEMPLAR_WARNINGS_WARNINGS_HPP

#include "exemplar/core/reporter.hpp"

#include <functional>
#include <source_location>
#include <string>
#include <string_view>

namespace exemplar::core {
class Example;
}

namespace exemplar::warnings {

/// Reports use of a deprecated feature. `call_site` defaults to the caller's
/// location; an explicit `call_site` in `data` is kept.
void deprecate(core::Reporter& reporter, std::string_view deprecated,
               core::DeprecationFields data = {},
               const std::source_location& loc = std::source_location::current());

/// Reports a free-form deprecation message.
void warn_deprecation(core::Reporter& reporter, std::string message);

struct WarnOptions {
    /// Append where the warning came from.
    bool spec_location = false;

    /// The example to attribute the warning to. Null means the example
    /// currently running, if any.
    const core::Example* example = nullptr;
};

using WarningHandler = std::function<void(const std::string&)>;

/// Replaces the warning handler and returns the previous one. An empty
/// handler restores the default.
auto set_warning_handler(WarningHandler handler) -> WarningHandler;

/// Emits `message` through the warning handler.
void warn_with(std::string message, const WarnOptions& options = {});

/// Runs `message` through the `spec_location` formatting of `warn_with`
/// without emitting it.
[[nodiscard]] auto format_warning(std::string message, const WarnOptions& options) -> std::string;

} // namespace exemplar::warnings

#endif // EXEMPLAR_WARNINGS_WARNINGS_HPP
