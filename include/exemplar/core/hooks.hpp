//! # Hooks
//!
//! `HookRegistry` is the contract the example orchestrator runs hooks
//! through. `HookList` is the in-memory registry used by `ExampleGroup`.
//!
//! ## Ordering
//!
//! | Phase           | Order                                        |
//! |-----------------|----------------------------------------------|
//! | before          | declaration order                            |
//! | after           | reverse declaration order                    |
//! | around          | first declared is outermost                  |
//!
//! A hook applies to an example when every tag in its filter is present on
//! the example with the same value. An empty filter applies everywhere.

#ifndef EXEMPLAR_CORE_HOOKS_HPP
#define EXEMPLAR_CORE_HOOKS_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/metadata.hpp"
#include "exemplar/core/procsy.hpp"

#include <functional>
#include <vector>

namespace exemplar::core {

class Example;
class GroupInstance;

enum class HookPhase { Before, After, Around };
enum class HookScope { Each, All };

[[nodiscard]] auto phase_name(HookPhase phase) -> const char*;
[[nodiscard]] auto scope_name(HookScope scope) -> const char*;

using Hook = std::function<void(GroupInstance&)>;
using AroundHook = std::function<void(GroupInstance&, Procsy&)>;

class HookRegistry {
public:
    virtual ~HookRegistry() = default;

    /// Runs the before or after hooks of `scope` that apply to `example`,
    /// in the example's bound group instance. Stops at the first hook that
    /// throws and lets the exception through.
    virtual void run(HookPhase phase, HookScope scope, Example& example) = 0;

    /// Runs the around(:each) hooks that apply to `example`, nested around
    /// `procsy`.
    virtual void run_around(Example& example, const Procsy& procsy) = 0;

    /// The around(:each) hooks that apply to `example`. The engine only uses
    /// this to skip wrapping when there are none.
    [[nodiscard]] virtual auto around_hooks_for(const Example& example) const
        -> std::vector<AroundHook> = 0;

    /// Runs before(:all) or after(:all) hooks in a group-level context that
    /// has no example bound.
    virtual void run_for_group(HookPhase phase, GroupInstance& instance) = 0;
};

class HookList : public HookRegistry {
public:
    void before(Hook hook, Tags filter = {});
    void after(Hook hook, Tags filter = {});
    void around(AroundHook hook, Tags filter = {});
    void before_all(Hook hook);
    void after_all(Hook hook);

    void run(HookPhase phase, HookScope scope, Example& example) override;
    void run_around(Example& example, const Procsy& procsy) override;
    [[nodiscard]] auto around_hooks_for(const Example& example) const
        -> std::vector<AroundHook> override;
    void run_for_group(HookPhase phase, GroupInstance& instance) override;

    /// Number of registered hooks for a phase and scope.
    [[nodiscard]] auto count(HookPhase phase, HookScope scope) const -> size_t;

private:
    template <typename Fn> struct Entry {
        Fn fn;
        Tags filter;
    };

    [[nodiscard]] static auto applies(const Tags& filter, const Example& example) -> bool;
    [[nodiscard]] static auto instance_of(Example& example) -> GroupInstance&;

    std::vector<Entry<Hook>> before_each_;
    std::vector<Entry<Hook>> after_each_;
    std::vector<Entry<AroundHook>> around_each_;
    std::vector<Hook> before_all_;
    std::vector<Hook> after_all_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_HOOKS_HPP
