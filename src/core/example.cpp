//! # Example Run Orchestration
//!
//! Sequencing of one example run, failure capture and final status.

#include "exemplar/core/example.hpp"

#include "exemplar/core/configuration.hpp"
#include "exemplar/core/current_example.hpp"
#include "exemplar/core/example_group.hpp"
#include "exemplar/core/group_instance.hpp"
#include "exemplar/core/hooks.hpp"
#include "exemplar/core/pending.hpp"
#include "exemplar/core/procsy.hpp"
#include "exemplar/core/reporter.hpp"
#include "exemplar/log/log.hpp"

#include <sstream>

namespace exemplar::core {

namespace {

/// Binds the reporter used for collision diagnostics for one call.
class ReporterBinding {
public:
    ReporterBinding(Reporter*& slot, Reporter& reporter) : slot_(slot), previous_(slot) {
        slot_ = &reporter;
    }
    ~ReporterBinding() {
        slot_ = previous_;
    }

    ReporterBinding(const ReporterBinding&) = delete;
    ReporterBinding& operator=(const ReporterBinding&) = delete;

private:
    Reporter*& slot_;
    Reporter* previous_;
};

} // namespace

Example::Example(const ExampleGroup& group, std::string description, Body body,
                 ExampleOptions options, SourceLocation location)
    : group_(group), options_(std::move(options)), body_(std::move(body)),
      metadata_(Metadata::for_example(group.metadata(), std::move(description), options_,
                                      std::move(location))),
      clock_(group.clock()) {
    if (!body_ && !metadata_.skip())
        metadata_.set_skip(pending::kNotYetImplemented);

    if (options_.pending && !is_skipped())
        pending::mark_pending(*this, *options_.pending);
}

// ============================================================================
// Public Operations
// ============================================================================

bool Example::run(GroupInstance& instance, Reporter& reporter) {
    if (execution_result().status() != Status::NotStarted) {
        EXEMPLAR_LOG_ERROR("example", "refusing to run `" << full_description() << "` again (status "
                                                          << status_name(execution_result().status())
                                                          << ")");
        return false;
    }

    CurrentExampleScope current(*this);
    ReporterBinding binding(reporter_, reporter);

    instance_ = &instance;
    instance.bind(this);

    start(reporter);

    try {
        if (is_skipped()) {
            pending::mark_pending(*this, skip_message());
        } else if (!configuration().dry_run) {
            with_around_each_hooks([this] { run_guarded_pipeline(); });
        }
    } catch (...) {
        set_exception(Failure::from_current_exception());
    }

    // Nothing the run leaves in the instance may be seen by the next example.
    instance.clear_locals();
    instance.bind(nullptr);
    instance_ = nullptr;

    try {
        assign_generated_description();
    } catch (...) {
        set_exception(Failure::from_current_exception(), "while assigning the example description");
    }

    return finish(reporter);
}

bool Example::fail_with_exception(Reporter& reporter, Failure failure) {
    if (execution_result().status() != Status::NotStarted) {
        EXEMPLAR_LOG_ERROR("example", "cannot fail `" << full_description()
                                                      << "`: it has already run");
        return false;
    }

    ReporterBinding binding(reporter_, reporter);
    start(reporter);
    set_exception(std::move(failure));
    return finish(reporter);
}

void Example::set_exception(Failure failure, std::string_view context, CollisionPolicy policy) {
    if (exception_) {
        if (policy == CollisionPolicy::Print)
            report_collision(failure, context);
        return;
    }

    EXEMPLAR_LOG_DEBUG("example", full_description() << ": captured " << failure.type << ": "
                                                     << failure.message);
    exception_ = std::move(failure);
}

// ============================================================================
// Identity
// ============================================================================

std::string Example::description() const {
    std::string description = metadata_.description();
    if (description.empty())
        description = "example at " + location();
    return configuration().format_description(description);
}

std::string Example::skip_message() const {
    const auto& reason = skip();
    if (reason && !reason->empty())
        return *reason;
    return pending::kNoReasonGiven;
}

const Configuration& Example::configuration() const {
    return group_.configuration();
}

// ============================================================================
// Start / Finish
// ============================================================================

void Example::start(Reporter& reporter) {
    reporter.example_started(*this);
    if (!metadata_.execution_result().record_started(clock_->now()))
        EXEMPLAR_LOG_ERROR("example", full_description() << ": result was already started");
    EXEMPLAR_LOG_DEBUG("example", "started " << full_description());
}

bool Example::finish(Reporter& reporter) {
    auto& result = metadata_.execution_result();

    if (exception_) {
        result.set_exception(*exception_);
        record_finished(Status::Failed);
        reporter.example_failed(*this);
        return false;
    }

    if (result.pending_message()) {
        record_finished(Status::Pending);
        reporter.example_pending(*this);
        return true;
    }

    record_finished(Status::Passed);
    reporter.example_passed(*this);
    return true;
}

void Example::record_finished(Status status) {
    if (!metadata_.execution_result().record_finished(status, clock_->now())) {
        EXEMPLAR_LOG_ERROR("example", full_description() << ": cannot finish as "
                                                         << status_name(status));
        return;
    }
    EXEMPLAR_LOG_DEBUG("example", full_description() << " " << status_name(status) << " in "
                                                     << execution_result().run_time_seconds()
                                                     << "s");
}

// ============================================================================
// Pipeline
// ============================================================================

void Example::with_around_each_hooks(const std::function<void()>& pipeline) {
    try {
        HookRegistry& hooks = group_.registry();
        if (hooks.around_hooks_for(*this).empty()) {
            pipeline();
        } else {
            hooks.run_around(*this, Procsy(metadata_, pipeline));
        }
    } catch (...) {
        set_exception(Failure::from_current_exception(), "in an around(:each) hook");
    }
}

void Example::run_guarded_pipeline() {
    if (!instance_)
        throw Error("`" + full_description() + "` was invoked outside of its run");

    Outcome outcome = Completed{};
    try {
        run_before_each();
        outcome = body_(*instance_);
        if (std::holds_alternative<Completed>(outcome) && is_pending())
            outcome = pending::fixed(*this);
    } catch (...) {
        outcome = Failed{Failure::from_current_exception()};
    }

    settle(std::move(outcome));
    run_after_each();
}

void Example::settle(Outcome outcome) {
    if (auto* failed = std::get_if<Failed>(&outcome)) {
        if (is_pending()) {
            EXEMPLAR_LOG_DEBUG("pending", full_description()
                                              << ": failed as expected with " << failed->failure.type);
            metadata_.execution_result().set_pending_exception(std::move(failed->failure));
        } else {
            set_exception(std::move(failed->failure));
        }
    } else if (auto* fixed = std::get_if<PendingFixed>(&outcome)) {
        set_exception(std::move(fixed->failure));
    }
    // Completed and SkippedNow leave nothing to record.
}

void Example::run_before_each() {
    instance_->mocks().setup();
    group_.registry().run(HookPhase::Before, HookScope::Each, *this);
}

void Example::run_after_each() {
    try {
        group_.registry().run(HookPhase::After, HookScope::Each, *this);
        verify_mocks();
    } catch (...) {
        set_exception(Failure::from_current_exception(), "in an after(:each) hook");
    }
    instance_->mocks().teardown();
}

void Example::verify_mocks() {
    try {
        instance_->mocks().verify();
    } catch (...) {
        Failure failure = Failure::from_current_exception();
        auto& result = metadata_.execution_result();
        if (result.pending_message()) {
            EXEMPLAR_LOG_DEBUG("pending", full_description() << ": verification failure ("
                                                             << failure.message
                                                             << ") absorbed by pending example");
            result.set_pending_fixed(false);
            metadata_.set_pending(true);
            exception_.reset();
        } else {
            set_exception(std::move(failure), {}, CollisionPolicy::DontPrint);
        }
    }
}

void Example::assign_generated_description() {
    const Configuration& config = configuration();
    if (!config.expecting_matcher_descriptions)
        return;

    matchers::DescriptionSource& source = config.description_source();
    if (metadata_.description_args().empty()) {
        if (auto generated = source.last_generated())
            metadata_.description_args().push_back(*generated);
    }
    source.clear();
}

void Example::report_collision(const Failure& failure, std::string_view context) {
    std::ostringstream oss;
    oss << "\nAn error occurred";
    if (!context.empty())
        oss << " " << context;
    oss << "\n  " << failure.type << ": " << failure.message << "\n  occurred at "
        << failure.first_frame() << "\n\n";

    if (reporter_) {
        reporter_->message(oss.str());
    } else {
        EXEMPLAR_LOG_WARN("example", full_description() << ":" << oss.str());
    }
}

} // namespace exemplar::core
