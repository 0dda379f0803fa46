//! # Example Group Tests
//!
//! Group runs: isolation between examples, before(:all)/after(:all) hooks,
//! nesting, collaborator injection and the logging reporter.

#include "exemplar/core/configuration.hpp"
#include "exemplar/core/example_group.hpp"
#include "exemplar/core/group_instance.hpp"
#include "exemplar/core/reporter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace exemplar;
using namespace exemplar::core;
using namespace exemplar::test_support;

class ExampleGroupTest : public ::testing::Test {
protected:
    ExampleGroupTest() : group("Stack") {}

    ExampleGroup group;
    RecordingReporter reporter;
    std::vector<std::string> trace;
};

// ============================================================================
// Declaration
// ============================================================================

TEST_F(ExampleGroupTest, DeclaresExamplesInOrder) {
    group.example("first", [] {});
    group.example("second", [] {});

    ASSERT_EQ(group.examples().size(), 2u);
    EXPECT_EQ(group.examples()[0]->description(), "first");
    EXPECT_EQ(group.examples()[1]->full_description(), "Stack second");
    EXPECT_EQ(group.description(), "Stack");
    EXPECT_GT(group.metadata()->location.line, 0u);
    EXPECT_NE(group.metadata()->location.file.find("example_group_test.cpp"), std::string::npos);
}

TEST_F(ExampleGroupTest, NestedGroupExtendsMetadata) {
    ExampleGroup nested(group, "when empty", {{"edge", "yes"}});
    auto& example = nested.example("has no top", [] {});

    EXPECT_EQ(example.full_description(), "Stack when empty has no top");
    EXPECT_EQ(example.metadata().tag("edge"), "yes");
    EXPECT_EQ(nested.metadata()->parent, group.metadata());
}

// ============================================================================
// Group Run
// ============================================================================

TEST_F(ExampleGroupTest, RunsEveryExampleAndReportsOverallResult) {
    group.example("passes", [] {});
    group.example("fails", [] { throw std::runtime_error("boom"); });
    group.example("pending", [] { throw std::runtime_error("todo"); },
                  ExampleOptions::pending_because());

    EXPECT_FALSE(group.run(reporter));
    EXPECT_EQ(reporter.events,
              (std::vector<std::string>{"started:Stack passes", "passed:Stack passes",
                                        "started:Stack fails", "failed:Stack fails",
                                        "started:Stack pending", "pending:Stack pending"}));
}

TEST_F(ExampleGroupTest, EachExampleGetsAFreshInstance) {
    bool saw_leak = false;
    group.example("writes", [](GroupInstance& ctx) { ctx.let("shared", 1); });
    group.example("reads", [&](GroupInstance& ctx) { saw_leak = ctx.has_local("shared"); });

    EXPECT_TRUE(group.run(reporter));
    EXPECT_FALSE(saw_leak);
}

TEST_F(ExampleGroupTest, AllHooksWrapTheWholeGroup) {
    group.hooks().before_all([&](GroupInstance& ctx) {
        EXPECT_FALSE(ctx.has_example());
        trace.push_back("before all");
    });
    group.hooks().after_all([&](GroupInstance&) { trace.push_back("after all 1"); });
    group.hooks().after_all([&](GroupInstance&) { trace.push_back("after all 2"); });
    group.hooks().before([&](GroupInstance&) { trace.push_back("before each"); });
    group.example("one", [&] { trace.push_back("one"); });
    group.example("two", [&] { trace.push_back("two"); });

    EXPECT_TRUE(group.run(reporter));
    EXPECT_EQ(trace, (std::vector<std::string>{"before all", "before each", "one", "before each",
                                               "two", "after all 2", "after all 1"}));
}

TEST_F(ExampleGroupTest, BeforeAllFailureFailsEveryExampleWithoutRunningIt) {
    group.hooks().before_all([](GroupInstance&) { throw std::runtime_error("no database"); });
    group.hooks().after_all([&](GroupInstance&) { trace.push_back("after all"); });
    group.example("one", [&] { trace.push_back("one"); });
    group.example("two", [&] { trace.push_back("two"); });

    EXPECT_FALSE(group.run(reporter));
    EXPECT_TRUE(trace.empty());
    for (const auto& example : group.examples()) {
        EXPECT_EQ(example->execution_result().status(), Status::Failed);
        EXPECT_EQ(example->exception()->message, "no database");
    }
}

TEST_F(ExampleGroupTest, AfterAllFailureIsReportedAsMessage) {
    group.hooks().after_all([](GroupInstance&) { throw std::logic_error("cleanup"); });
    group.example("passes", [] {});

    EXPECT_TRUE(group.run(reporter));
    EXPECT_EQ(group.examples()[0]->execution_result().status(), Status::Passed);
    ASSERT_EQ(reporter.messages.size(), 1u);
    EXPECT_EQ(reporter.messages[0], "\nAn error occurred in an after(:all) hook\n"
                                    "  std::logic_error: cleanup\n"
                                    "  occurred at <no backtrace>\n\n");
}

TEST_F(ExampleGroupTest, DryRunSkipsAllHooks) {
    auto config = make_rc<Configuration>();
    config->dry_run = true;
    group.set_configuration(config);
    group.hooks().before_all([&](GroupInstance&) { trace.push_back("before all"); });
    group.hooks().after_all([&](GroupInstance&) { trace.push_back("after all"); });
    group.example("dry", [&] { trace.push_back("body"); });

    EXPECT_TRUE(group.run(reporter));
    EXPECT_TRUE(trace.empty());
    EXPECT_EQ(group.examples()[0]->execution_result().status(), Status::Passed);
}

// ============================================================================
// Collaborators
// ============================================================================

TEST_F(ExampleGroupTest, MockFactoryIsUsedPerExample) {
    MockCalls calls;
    group.set_mock_factory([&] { return make_box<RecordingMocks>(calls); });
    group.example("one", [] {});
    group.example("two", [] {});

    EXPECT_TRUE(group.run(reporter));
    EXPECT_EQ(calls.setup, 2);
    EXPECT_EQ(calls.verify, 2);
    EXPECT_EQ(calls.teardown, 2);
}

namespace {

/// Registry that records what the engine asks of it and runs nothing.
class RecordingRegistry : public HookRegistry {
public:
    void run(HookPhase phase, HookScope scope, Example&) override {
        calls.push_back(std::string(phase_name(phase)) + ":" + scope_name(scope));
    }
    void run_around(Example&, const Procsy& procsy) override {
        calls.push_back("around");
        procsy.run();
    }
    [[nodiscard]] auto around_hooks_for(const Example&) const -> std::vector<AroundHook> override {
        if (!with_around)
            return {};
        return {[](GroupInstance&, Procsy& p) { p.run(); }};
    }
    void run_for_group(HookPhase phase, GroupInstance&) override {
        calls.push_back(std::string(phase_name(phase)) + ":all");
    }

    bool with_around = false;
    std::vector<std::string> calls;
};

} // namespace

TEST_F(ExampleGroupTest, CustomHookRegistry) {
    auto registry = make_rc<RecordingRegistry>();
    group.use_hook_registry(registry);
    group.example("one", [] {});

    EXPECT_TRUE(group.run(reporter));
    EXPECT_EQ(registry->calls, (std::vector<std::string>{"before:all", "before:each",
                                                         "after:each", "after:all"}));
}

TEST_F(ExampleGroupTest, AroundIsOnlyUsedWhenHooksExist) {
    auto registry = make_rc<RecordingRegistry>();
    registry->with_around = true;
    group.use_hook_registry(registry);
    auto& example = group.example("one", [] {});

    GroupInstance instance;
    EXPECT_TRUE(example.run(instance, reporter));
    EXPECT_EQ(registry->calls,
              (std::vector<std::string>{"around", "before:each", "after:each"}));
}

TEST_F(ExampleGroupTest, RejectsMissingCollaborators) {
    EXPECT_THROW(group.use_hook_registry(nullptr), Error);
    EXPECT_THROW(group.set_configuration(nullptr), Error);
    EXPECT_THROW(group.set_clock(nullptr), Error);
}

// ============================================================================
// LogReporter
// ============================================================================

TEST_F(ExampleGroupTest, LogReporterCountsAndLogs) {
    LogCapture capture;
    LogReporter log_reporter;
    group.example("passes", [] {});
    group.example("fails", [] { throw std::runtime_error("boom"); });
    group.example("pending", [] { throw std::runtime_error("todo"); },
                  ExampleOptions::pending_because("later"));

    EXPECT_FALSE(group.run(log_reporter));
    EXPECT_EQ(log_reporter.passed(), 1u);
    EXPECT_EQ(log_reporter.failed(), 1u);
    EXPECT_EQ(log_reporter.pending(), 1u);
    EXPECT_EQ(log_reporter.summary(), "3 examples, 1 failure, 1 pending");

    EXPECT_TRUE(capture.contains("reporter", "passed: Stack passes"));
    EXPECT_TRUE(capture.contains("reporter", "std::runtime_error: boom"));
    EXPECT_TRUE(capture.contains("reporter", "pending: Stack pending (later)"));
    EXPECT_TRUE(capture.contains("group", "running `Stack` (3 examples)"));
}

TEST(LogReporterTest, SummaryWithoutPending) {
    LogReporter reporter;
    EXPECT_EQ(reporter.summary(), "0 examples, 0 failures");
}

// ============================================================================
// GroupInstance
// ============================================================================

TEST(GroupInstanceTest, LocalsAreTypedAndClearable) {
    GroupInstance instance;
    instance.let("count", 3);
    instance.let("name", std::string("stack"));

    EXPECT_EQ(instance.get<int>("count"), 3);
    instance.get<int>("count") = 4;
    EXPECT_EQ(instance.get<int>("count"), 4);
    EXPECT_EQ(instance.local_count(), 2u);

    auto wrong_type = instance.find<double>("count");
    ASSERT_TRUE(is_err(wrong_type));
    EXPECT_EQ(unwrap_err(wrong_type), "local `count` holds a different type");
    EXPECT_THROW((void)instance.get<double>("count"), Error);

    auto missing = instance.find<int>("missing");
    EXPECT_TRUE(is_err(missing));

    auto found = instance.find<std::string>("name");
    ASSERT_TRUE(is_ok(found));
    EXPECT_EQ(*unwrap(found), "stack");

    instance.clear_locals();
    EXPECT_EQ(instance.local_count(), 0u);
    EXPECT_FALSE(instance.has_local("name"));
}

TEST(GroupInstanceTest, NoExampleOutsideARun) {
    GroupInstance instance;
    EXPECT_FALSE(instance.has_example());
    EXPECT_THROW((void)instance.example(), Error);
}
