//! # Example
//!
//! One declared test and the orchestration of a single run of it.
//!
//! ## Run Lifecycle
//!
//! ```text
//! start ─┬─ skipped ──────────────────────────────────────────┐
//!        ├─ dry run ──────────────────────────────────────────┤
//!        └─ around hooks( setup mocks → before → body →       │
//!                         pending-fixed check → after →       │
//!                         verify mocks → teardown mocks )     │
//!        clear group instance → generated description ◄───────┘
//!        finish → passed | failed | pending
//! ```
//!
//! ## Failure Capture
//!
//! Every failure on every path goes through `set_exception`. The first one
//! captured is the example's failure. Later ones are written to the
//! reporter's message channel (unless marked `DontPrint`) and otherwise
//! dropped, so `run` always reaches `finish` and always returns.

#ifndef EXEMPLAR_CORE_EXAMPLE_HPP
#define EXEMPLAR_CORE_EXAMPLE_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/clock.hpp"
#include "exemplar/core/failure.hpp"
#include "exemplar/core/metadata.hpp"
#include "exemplar/core/outcome.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace exemplar::core {

struct Configuration;
class ExampleGroup;
class GroupInstance;
class Reporter;

// ============================================================================
// Body
// ============================================================================

/// The code of an example. Accepts any callable taking a `GroupInstance&`
/// or nothing, returning `void` or something convertible to `Outcome`. A
/// body signals failure by throwing or by returning `Failed`.
class Body {
public:
    using Fn = std::function<Outcome(GroupInstance&)>;

    Body() = default;

    template <typename F,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Body>>>
    Body(F fn) : fn_(adapt(std::move(fn))) {}

    auto operator()(GroupInstance& instance) const -> Outcome {
        return fn_(instance);
    }

    explicit operator bool() const {
        return static_cast<bool>(fn_);
    }

private:
    template <typename F> static auto adapt(F fn) -> Fn {
        if constexpr (std::is_invocable_v<F&, GroupInstance&>) {
            if constexpr (std::is_convertible_v<std::invoke_result_t<F&, GroupInstance&>, Outcome>) {
                return [fn = std::move(fn)](GroupInstance& instance) mutable -> Outcome {
                    return fn(instance);
                };
            } else {
                return [fn = std::move(fn)](GroupInstance& instance) mutable -> Outcome {
                    fn(instance);
                    return Completed{};
                };
            }
        } else {
            static_assert(std::is_invocable_v<F&>,
                          "an example body takes GroupInstance& or no arguments");
            if constexpr (std::is_convertible_v<std::invoke_result_t<F&>, Outcome>) {
                return [fn = std::move(fn)](GroupInstance&) mutable -> Outcome { return fn(); };
            } else {
                return [fn = std::move(fn)](GroupInstance&) mutable -> Outcome {
                    fn();
                    return Completed{};
                };
            }
        }
    }

    Fn fn_;
};

// ============================================================================
// Example
// ============================================================================

/// Whether a failure that loses the first-wins race is written out.
enum class CollisionPolicy {
    Print,    ///< Write a diagnostic to the reporter's message channel
    DontPrint ///< Drop silently (the failure is reported elsewhere)
};

class Example {
public:
    /// Declares an example in `group`. An example without a body is skipped
    /// as "Not yet implemented". A `pending` option marks it pending now.
    Example(const ExampleGroup& group, std::string description, Body body,
            ExampleOptions options, SourceLocation location);

    Example(const Example&) = delete;
    Example& operator=(const Example&) = delete;

    /// Runs the example in `instance`, reporting to `reporter`. Returns
    /// false only when the example failed. An example runs at most once;
    /// a second call logs an error and returns false.
    bool run(GroupInstance& instance, Reporter& reporter);

    /// Reports the example as failed with `failure` without running any
    /// hook or the body. Used when group-level setup failed.
    bool fail_with_exception(Reporter& reporter, Failure failure);

    /// Captures a failure. The first captured failure wins; later ones are
    /// written to the reporter tagged with `context`, unless `policy` is
    /// `DontPrint`.
    void set_exception(Failure failure, std::string_view context = {},
                       CollisionPolicy policy = CollisionPolicy::Print);

    // ------------------------------------------------------------------------
    // Identity
    // ------------------------------------------------------------------------

    /// The declared or generated description, or "example at <location>",
    /// passed through the configured description formatter.
    [[nodiscard]] auto description() const -> std::string;

    [[nodiscard]] auto source_location() const -> const SourceLocation& {
        return metadata_.source_location();
    }

    /// First failure captured during the run.
    [[nodiscard]] auto exception() const -> const std::optional<Failure>& {
        return exception_;
    }

    [[nodiscard]] auto metadata() const -> const Metadata& {
        return metadata_;
    }
    [[nodiscard]] auto metadata() -> Metadata& {
        return metadata_;
    }

    [[nodiscard]] auto options() const -> const ExampleOptions& {
        return options_;
    }

    [[nodiscard]] auto example_group() const -> const ExampleGroup& {
        return group_;
    }

    /// The instance bound for the current run, or null outside a run.
    [[nodiscard]] auto example_group_instance() const -> GroupInstance* {
        return instance_;
    }

    // ------------------------------------------------------------------------
    // Metadata accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] auto execution_result() const -> const ExecutionResult& {
        return metadata_.execution_result();
    }
    [[nodiscard]] auto file_path() const -> const std::string& {
        return metadata_.file_path();
    }
    [[nodiscard]] auto full_description() const -> std::string {
        return metadata_.full_description();
    }
    [[nodiscard]] auto location() const -> std::string {
        return metadata_.location();
    }
    [[nodiscard]] auto pending() const -> bool {
        return metadata_.pending();
    }
    [[nodiscard]] auto skip() const -> const std::optional<std::string>& {
        return metadata_.skip();
    }
    [[nodiscard]] auto is_pending() const -> bool {
        return pending();
    }
    [[nodiscard]] auto is_skipped() const -> bool {
        return skip().has_value();
    }

    /// The skip reason, or "No reason given".
    [[nodiscard]] auto skip_message() const -> std::string;

    void set_clock(Rc<Clock> clock) {
        clock_ = std::move(clock);
    }

private:
    [[nodiscard]] auto configuration() const -> const Configuration&;

    void start(Reporter& reporter);
    bool finish(Reporter& reporter);
    void record_finished(Status status);

    void with_around_each_hooks(const std::function<void()>& pipeline);
    void run_guarded_pipeline();
    void settle(Outcome outcome);
    void run_before_each();
    void run_after_each();
    void verify_mocks();
    void assign_generated_description();
    void report_collision(const Failure& failure, std::string_view context);

    const ExampleGroup& group_;
    ExampleOptions options_;
    Body body_;
    Metadata metadata_;
    Rc<Clock> clock_;
    std::optional<Failure> exception_;
    GroupInstance* instance_ = nullptr;
    Reporter* reporter_ = nullptr;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_EXAMPLE_HPP
