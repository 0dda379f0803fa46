//! # Reporter
//!
//! Lifecycle events emitted by the orchestrator. Formatting and output are
//! the reporter's business; the engine only calls these methods.

#ifndef EXEMPLAR_CORE_REPORTER_HPP
#define EXEMPLAR_CORE_REPORTER_HPP

#include <cstddef>
#include <map>
#include <string>

namespace exemplar::core {

class Example;

/// Named fields of a deprecation notice ("deprecated", "call_site",
/// "replacement", "message", ...).
using DeprecationFields = std::map<std::string, std::string>;

class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void example_started(const Example& example) = 0;
    virtual void example_passed(const Example& example) = 0;
    virtual void example_failed(const Example& example) = 0;
    virtual void example_pending(const Example& example) = 0;

    /// Free-form diagnostic text.
    virtual void message(const std::string& text) = 0;

    virtual void deprecation(const DeprecationFields& fields) = 0;
};

/// Forwards every event to the logger and keeps counts.
class LogReporter : public Reporter {
public:
    void example_started(const Example& example) override;
    void example_passed(const Example& example) override;
    void example_failed(const Example& example) override;
    void example_pending(const Example& example) override;
    void message(const std::string& text) override;
    void deprecation(const DeprecationFields& fields) override;

    [[nodiscard]] size_t passed() const {
        return passed_;
    }
    [[nodiscard]] size_t failed() const {
        return failed_;
    }
    [[nodiscard]] size_t pending() const {
        return pending_;
    }

    /// "N examples, F failures, P pending"
    [[nodiscard]] std::string summary() const;

private:
    size_t passed_ = 0;
    size_t failed_ = 0;
    size_t pending_ = 0;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_REPORTER_HPP
