#include "exemplar/warnings/warnings.hpp"

#include "exemplar/common.hpp"
#include "exemplar/core/current_example.hpp"
#include "exemplar/core/example.hpp"
#include "exemplar/log/log.hpp"

#include <mutex>

namespace exemplar::warnings {

namespace {

void log_warning(const std::string& message) {
    EXEMPLAR_LOG_WARN("warnings", message);
}

std::mutex& handler_mutex() {
    static std::mutex mutex;
    return mutex;
}

WarningHandler& handler_slot() {
    static WarningHandler handler = log_warning;
    return handler;
}

} // namespace

void deprecate(core::Reporter& reporter, std::string_view deprecated,
               core::DeprecationFields data, const std::source_location& loc) {
    data["deprecated"] = std::string(deprecated);
    // emplace keeps a call_site the caller supplied
    data.emplace("call_site", SourceLocation::here(loc).to_string());
    EXEMPLAR_LOG_DEBUG("warnings", "deprecated: " << deprecated);
    reporter.deprecation(data);
}

void warn_deprecation(core::Reporter& reporter, std::string message) {
    reporter.deprecation({{"message", std::move(message)}});
}

WarningHandler set_warning_handler(WarningHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex());
    WarningHandler previous = std::move(handler_slot());
    handler_slot() = handler ? std::move(handler) : WarningHandler(log_warning);
    return previous;
}

std::string format_warning(std::string message, const WarnOptions& options) {
    if (!options.spec_location)
        return message;

    if (message.empty() || message.back() != '.')
        message += '.';

    const core::Example* example = options.example ? options.example : core::current_example();
    if (example) {
        message += " Warning generated from example at `" + example->location() + "`.";
    } else {
        message += " Could not determine which call generated this warning.";
    }
    return message;
}

void warn_with(std::string message, const WarnOptions& options) {
    std::string formatted = format_warning(std::move(message), options);

    WarningHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = handler_slot();
    }
    handler(formatted);
}

} // namespace exemplar::warnings
