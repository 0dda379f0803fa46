//! # Execution Result
//!
//! Timing and final status of one example run.
//!
//! ## Status Transitions
//!
//! ```text
//! NotStarted → Started → { Passed | Failed | Pending }
//! ```
//!
//! Transitions never go backward. `run_time` is only set together with a
//! terminal status and always equals `finished_at - started_at`.

#ifndef EXEMPLAR_CORE_EXECUTION_RESULT_HPP
#define EXEMPLAR_CORE_EXECUTION_RESULT_HPP

#include "exemplar/core/clock.hpp"
#include "exemplar/core/failure.hpp"

#include <optional>
#include <string>

namespace exemplar::core {

enum class Status {
    NotStarted,
    Started,
    Passed,
    Failed,
    Pending,
};

/// Lower-case status name ("not_started", "passed", ...).
[[nodiscard]] auto status_name(Status status) -> const char*;

/// True for Passed, Failed and Pending.
[[nodiscard]] auto is_terminal(Status status) -> bool;

class ExecutionResult {
public:
    [[nodiscard]] auto status() const -> Status {
        return status_;
    }

    [[nodiscard]] auto started_at() const -> const std::optional<Timestamp>& {
        return started_at_;
    }

    [[nodiscard]] auto finished_at() const -> const std::optional<Timestamp>& {
        return finished_at_;
    }

    [[nodiscard]] auto run_time() const -> const std::optional<Duration>& {
        return run_time_;
    }

    /// Run time in seconds, 0.0 while the example has not finished.
    [[nodiscard]] auto run_time_seconds() const -> double;

    /// Moves NotStarted → Started. Returns false (and changes nothing) from
    /// any other status.
    [[nodiscard]] auto record_started(Timestamp at) -> bool;

    /// Moves Started → `status` and derives the run time. Returns false (and
    /// changes nothing) if `status` is not terminal or the result has not
    /// been started.
    [[nodiscard]] auto record_finished(Status status, Timestamp at) -> bool;

    // ------------------------------------------------------------------------
    // Pending bookkeeping
    // ------------------------------------------------------------------------

    [[nodiscard]] auto pending_message() const -> const std::optional<std::string>& {
        return pending_message_;
    }
    void set_pending_message(std::string message) {
        pending_message_ = std::move(message);
    }

    [[nodiscard]] auto pending_fixed() const -> std::optional<bool> {
        return pending_fixed_;
    }
    void set_pending_fixed(bool fixed) {
        pending_fixed_ = fixed;
    }

    /// Failure swallowed because the example was pending.
    [[nodiscard]] auto pending_exception() const -> const std::optional<Failure>& {
        return pending_exception_;
    }
    void set_pending_exception(Failure failure) {
        pending_exception_ = std::move(failure);
    }

    /// Failure reported as the example's result. Set when finishing as Failed.
    [[nodiscard]] auto exception() const -> const std::optional<Failure>& {
        return exception_;
    }
    void set_exception(Failure failure) {
        exception_ = std::move(failure);
    }

private:
    Status status_ = Status::NotStarted;
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> finished_at_;
    std::optional<Duration> run_time_;
    std::optional<std::string> pending_message_;
    std::optional<bool> pending_fixed_;
    std::optional<Failure> pending_exception_;
    std::optional<Failure> exception_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_EXECUTION_RESULT_HPP
