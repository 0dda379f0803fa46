//! # Example Group
//!
//! A flat, programmatically built group of examples sharing metadata, hooks,
//! configuration, a clock and a mocking collaborator.
//!
//! ```cpp
//! ExampleGroup group("Stack");
//! group.hooks().before([](GroupInstance& ctx) { ctx.let("stack", std::vector<int>{}); });
//! group.example("starts empty", [](GroupInstance& ctx) {
//!     expect_true(ctx.get<std::vector<int>>("stack").empty(), "be empty");
//! });
//! LogReporter reporter;
//! bool ok = group.run(reporter);
//! ```

#ifndef EXEMPLAR_CORE_EXAMPLE_GROUP_HPP
#define EXEMPLAR_CORE_EXAMPLE_GROUP_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/clock.hpp"
#include "exemplar/core/configuration.hpp"
#include "exemplar/core/example.hpp"
#include "exemplar/core/group_instance.hpp"
#include "exemplar/core/hooks.hpp"
#include "exemplar/core/metadata.hpp"
#include "exemplar/core/mocks.hpp"

#include <functional>
#include <source_location>
#include <string>
#include <vector>

namespace exemplar::core {

class Reporter;

class ExampleGroup {
public:
    using MockFactory = std::function<Box<MockLifecycle>()>;

    explicit ExampleGroup(std::string description, Tags tags = {},
                          const std::source_location& loc = std::source_location::current());

    /// Nested under `parent`'s metadata. Hooks are not inherited.
    ExampleGroup(const ExampleGroup& parent, std::string description, Tags tags = {},
                 const std::source_location& loc = std::source_location::current());

    ExampleGroup(const ExampleGroup&) = delete;
    ExampleGroup& operator=(const ExampleGroup&) = delete;

    /// Declares an example. The returned reference stays valid for the
    /// lifetime of the group.
    Example& example(std::string description, Body body, ExampleOptions options = {},
                     const std::source_location& loc = std::source_location::current());

    /// Runs before(:all) hooks, every example in declaration order (each in
    /// a fresh instance), then after(:all) hooks. Returns false if any
    /// example failed.
    bool run(Reporter& reporter);

    /// A fresh execution context with its own mocking collaborator.
    [[nodiscard]] auto make_instance() const -> Box<GroupInstance>;

    // ------------------------------------------------------------------------
    // Collaborators
    // ------------------------------------------------------------------------

    /// Hook storage for declaring hooks.
    [[nodiscard]] auto hooks() -> HookList& {
        return *hook_list_;
    }

    /// The registry examples run their hooks through. `hooks()` unless
    /// replaced with `use_hook_registry`.
    [[nodiscard]] auto registry() const -> HookRegistry& {
        return *registry_;
    }
    void use_hook_registry(Rc<HookRegistry> registry);

    [[nodiscard]] auto configuration() const -> const Configuration& {
        return *configuration_;
    }
    void set_configuration(Rc<const Configuration> configuration);

    [[nodiscard]] auto clock() const -> const Rc<Clock>& {
        return clock_;
    }
    /// Applies to examples declared afterwards.
    void set_clock(Rc<Clock> clock);

    void set_mock_factory(MockFactory factory) {
        mock_factory_ = std::move(factory);
    }

    // ------------------------------------------------------------------------
    // Identity
    // ------------------------------------------------------------------------

    [[nodiscard]] auto metadata() const -> const Rc<const GroupMetadata>& {
        return metadata_;
    }

    [[nodiscard]] auto description() const -> const std::string& {
        return metadata_->description;
    }

    [[nodiscard]] auto examples() const -> const std::vector<Box<Example>>& {
        return examples_;
    }

private:
    void report_after_all_failure(Reporter& reporter, const Failure& failure) const;

    Rc<const GroupMetadata> metadata_;
    Rc<HookList> hook_list_;
    Rc<HookRegistry> registry_;
    Rc<const Configuration> configuration_;
    Rc<Clock> clock_;
    MockFactory mock_factory_;
    std::vector<Box<Example>> examples_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_EXAMPLE_GROUP_HPP
