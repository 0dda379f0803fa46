//! # Hook List
//!
//! In-memory hook storage and the around-hook nesting.

#include "exemplar/core/hooks.hpp"

#include "exemplar/core/example.hpp"
#include "exemplar/core/group_instance.hpp"
#include "exemplar/log/log.hpp"

namespace exemplar::core {

const char* phase_name(HookPhase phase) {
    switch (phase) {
    case HookPhase::Before:
        return "before";
    case HookPhase::After:
        return "after";
    case HookPhase::Around:
        return "around";
    }
    return "unknown";
}

const char* scope_name(HookScope scope) {
    switch (scope) {
    case HookScope::Each:
        return "each";
    case HookScope::All:
        return "all";
    }
    return "unknown";
}

void HookList::before(Hook hook, Tags filter) {
    before_each_.push_back({std::move(hook), std::move(filter)});
}

void HookList::after(Hook hook, Tags filter) {
    after_each_.push_back({std::move(hook), std::move(filter)});
}

void HookList::around(AroundHook hook, Tags filter) {
    around_each_.push_back({std::move(hook), std::move(filter)});
}

void HookList::before_all(Hook hook) {
    before_all_.push_back(std::move(hook));
}

void HookList::after_all(Hook hook) {
    after_all_.push_back(std::move(hook));
}

bool HookList::applies(const Tags& filter, const Example& example) {
    for (const auto& [key, value] : filter) {
        auto actual = example.metadata().tag(key);
        if (!actual || *actual != value)
            return false;
    }
    return true;
}

GroupInstance& HookList::instance_of(Example& example) {
    GroupInstance* instance = example.example_group_instance();
    if (!instance)
        throw Error("hooks for `" + example.full_description() +
                    "` run outside of the example's run");
    return *instance;
}

void HookList::run(HookPhase phase, HookScope scope, Example& example) {
    if (scope == HookScope::All) {
        run_for_group(phase, instance_of(example));
        return;
    }

    GroupInstance& instance = instance_of(example);
    EXEMPLAR_LOG_TRACE("hooks", phase_name(phase) << "(:each) for " << example.full_description());

    switch (phase) {
    case HookPhase::Before:
        for (const auto& entry : before_each_) {
            if (applies(entry.filter, example))
                entry.fn(instance);
        }
        break;
    case HookPhase::After:
        for (auto it = after_each_.rbegin(); it != after_each_.rend(); ++it) {
            if (applies(it->filter, example))
                it->fn(instance);
        }
        break;
    case HookPhase::Around:
        throw Error("around hooks wrap a pipeline; use run_around");
    }
}

std::vector<AroundHook> HookList::around_hooks_for(const Example& example) const {
    std::vector<AroundHook> hooks;
    for (const auto& entry : around_each_) {
        if (applies(entry.filter, example))
            hooks.push_back(entry.fn);
    }
    return hooks;
}

void HookList::run_around(Example& example, const Procsy& procsy) {
    GroupInstance& instance = instance_of(example);
    auto hooks = around_hooks_for(example);
    EXEMPLAR_LOG_TRACE("hooks", hooks.size() << " around(:each) hook(s) for "
                                             << example.full_description());

    // Build inside-out so that the first declared hook is called first.
    Procsy chain = procsy;
    for (auto it = hooks.rbegin(); it != hooks.rend(); ++it) {
        chain = procsy.wrap([hook = *it, inner = chain, &instance]() mutable {
            hook(instance, inner);
        });
    }
    chain.run();
}

void HookList::run_for_group(HookPhase phase, GroupInstance& instance) {
    switch (phase) {
    case HookPhase::Before:
        for (const auto& hook : before_all_)
            hook(instance);
        break;
    case HookPhase::After:
        for (auto it = after_all_.rbegin(); it != after_all_.rend(); ++it)
            (*it)(instance);
        break;
    case HookPhase::Around:
        throw Error("around(:all) hooks are not supported");
    }
}

size_t HookList::count(HookPhase phase, HookScope scope) const {
    if (scope == HookScope::All) {
        switch (phase) {
        case HookPhase::Before:
            return before_all_.size();
        case HookPhase::After:
            return after_all_.size();
        case HookPhase::Around:
            return 0;
        }
        return 0;
    }
    switch (phase) {
    case HookPhase::Before:
        return before_each_.size();
    case HookPhase::After:
        return after_each_.size();
    case HookPhase::Around:
        return around_each_.size();
    }
    return 0;
}

} // namespace exemplar::core
