//! # Log Reporter
//!
//! Reporter that writes lifecycle events through the "reporter" log module.

#include "exemplar/core/example.hpp"
#include "exemplar/core/pending.hpp"
#include "exemplar/core/reporter.hpp"
#include "exemplar/log/log.hpp"

#include <sstream>

namespace exemplar::core {

void LogReporter::example_started(const Example& example) {
    EXEMPLAR_LOG_DEBUG("reporter", "started: " << example.full_description());
}

void LogReporter::example_passed(const Example& example) {
    ++passed_;
    EXEMPLAR_LOG_INFO("reporter", "passed: " << example.full_description() << " ("
                                             << example.execution_result().run_time_seconds()
                                             << "s)");
}

void LogReporter::example_failed(const Example& example) {
    ++failed_;
    const auto& failure = example.exception();
    if (failure) {
        EXEMPLAR_LOG_ERROR("reporter", "failed: " << example.full_description() << "\n  "
                                                  << failure->type << ": " << failure->message
                                                  << "\n  # " << failure->first_frame());
    } else {
        EXEMPLAR_LOG_ERROR("reporter", "failed: " << example.full_description());
    }
}

void LogReporter::example_pending(const Example& example) {
    ++pending_;
    const auto& message = example.execution_result().pending_message();
    EXEMPLAR_LOG_INFO("reporter", "pending: " << example.full_description() << " ("
                                              << message.value_or(pending::kNoReasonGiven)
                                              << ")");
}

void LogReporter::message(const std::string& text) {
    EXEMPLAR_LOG_WARN("reporter", text);
}

void LogReporter::deprecation(const DeprecationFields& fields) {
    std::ostringstream oss;
    oss << "deprecation:";
    for (const auto& [key, value] : fields)
        oss << " " << key << "=" << value;
    EXEMPLAR_LOG_WARN("reporter", oss.str());
}

std::string LogReporter::summary() const {
    std::ostringstream oss;
    const size_t total = passed_ + failed_ + pending_;
    oss << total << (total == 1 ? " example, " : " examples, ") << failed_
        << (failed_ == 1 ? " failure" : " failures");
    if (pending_ > 0)
        oss << ", " << pending_ << " pending";
    return oss.str();
}

} // namespace exemplar::core
