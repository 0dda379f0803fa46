//! # Example Group Runner
//!
//! Declaration of examples and the group-level run: before(:all) hooks,
//! each example in its own instance, after(:all) hooks.

#include "exemplar/core/example_group.hpp"

#include "exemplar/core/reporter.hpp"
#include "exemplar/log/log.hpp"

#include <sstream>

namespace exemplar::core {

namespace {

auto make_metadata(std::string description, Tags tags, const std::source_location& loc,
                   Rc<const GroupMetadata> parent) -> Rc<const GroupMetadata> {
    auto metadata = make_rc<GroupMetadata>();
    metadata->description = std::move(description);
    metadata->location = SourceLocation::here(loc);
    metadata->tags = std::move(tags);
    metadata->parent = std::move(parent);
    return metadata;
}

} // namespace

ExampleGroup::ExampleGroup(std::string description, Tags tags, const std::source_location& loc)
    : metadata_(make_metadata(std::move(description), std::move(tags), loc, nullptr)),
      hook_list_(make_rc<HookList>()), registry_(hook_list_),
      configuration_(make_rc<Configuration>()), clock_(SystemClock::shared()) {}

ExampleGroup::ExampleGroup(const ExampleGroup& parent, std::string description, Tags tags,
                           const std::source_location& loc)
    : metadata_(make_metadata(std::move(description), std::move(tags), loc, parent.metadata_)),
      hook_list_(make_rc<HookList>()), registry_(hook_list_),
      configuration_(parent.configuration_), clock_(parent.clock_),
      mock_factory_(parent.mock_factory_) {}

Example& ExampleGroup::example(std::string description, Body body, ExampleOptions options,
                               const std::source_location& loc) {
    examples_.push_back(make_box<Example>(*this, std::move(description), std::move(body),
                                          std::move(options), SourceLocation::here(loc)));
    return *examples_.back();
}

void ExampleGroup::use_hook_registry(Rc<HookRegistry> registry) {
    if (!registry)
        throw Error("a hook registry is required");
    registry_ = std::move(registry);
}

void ExampleGroup::set_configuration(Rc<const Configuration> configuration) {
    if (!configuration)
        throw Error("a configuration is required");
    configuration_ = std::move(configuration);
}

void ExampleGroup::set_clock(Rc<Clock> clock) {
    if (!clock)
        throw Error("a clock is required");
    clock_ = std::move(clock);
}

Box<GroupInstance> ExampleGroup::make_instance() const {
    if (mock_factory_)
        return make_box<GroupInstance>(mock_factory_());
    return make_box<GroupInstance>();
}

// ============================================================================
// Group Run
// ============================================================================

bool ExampleGroup::run(Reporter& reporter) {
    EXEMPLAR_LOG_INFO("group", "running `" << metadata_->full_description() << "` ("
                                           << examples_.size() << " examples)");

    const bool dry_run = configuration_->dry_run;
    auto group_instance = make_instance();

    if (!dry_run) {
        try {
            registry_->run_for_group(HookPhase::Before, *group_instance);
        } catch (...) {
            Failure failure = Failure::from_current_exception();
            EXEMPLAR_LOG_ERROR("group", "before(:all) hook failed in `"
                                            << metadata_->full_description()
                                            << "`: " << failure.message);
            bool ok = true;
            for (auto& example : examples_)
                ok = example->fail_with_exception(reporter, failure) && ok;
            return ok;
        }
    }

    bool ok = true;
    for (auto& example : examples_) {
        auto instance = make_instance();
        ok = example->run(*instance, reporter) && ok;
    }

    if (!dry_run) {
        try {
            registry_->run_for_group(HookPhase::After, *group_instance);
        } catch (...) {
            report_after_all_failure(reporter, Failure::from_current_exception());
        }
    }

    return ok;
}

void ExampleGroup::report_after_all_failure(Reporter& reporter, const Failure& failure) const {
    EXEMPLAR_LOG_ERROR("group", "after(:all) hook failed in `" << metadata_->full_description()
                                                               << "`: " << failure.message);
    std::ostringstream oss;
    oss << "\nAn error occurred in an after(:all) hook\n  " << failure.type << ": "
        << failure.message << "\n  occurred at " << failure.first_frame() << "\n\n";
    reporter.message(oss.str());
}

} // namespace exemplar::core
