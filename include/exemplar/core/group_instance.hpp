//! # Group Instance
//!
//! The execution context handed to example bodies and hooks. It holds
//! exactly the state a body may touch: the running example, named local
//! values, the mocking collaborator, and the dynamic pending/skip calls.
//!
//! An instance is bound to one example for the duration of one run. At the
//! end of the run every local is erased, so nothing one example stores is
//! visible to the next.

#ifndef EXEMPLAR_CORE_GROUP_INSTANCE_HPP
#define EXEMPLAR_CORE_GROUP_INSTANCE_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/mocks.hpp"
#include "exemplar/core/outcome.hpp"

#include <any>
#include <map>
#include <string>

namespace exemplar::core {

class Example;

class GroupInstance {
public:
    GroupInstance();
    explicit GroupInstance(Box<MockLifecycle> mocks);

    GroupInstance(const GroupInstance&) = delete;
    GroupInstance& operator=(const GroupInstance&) = delete;

    /// The example currently running in this context.
    /// Throws `exemplar::Error` when no example is bound (e.g. in a
    /// before(:all) hook).
    [[nodiscard]] auto example() const -> Example&;

    [[nodiscard]] auto has_example() const -> bool {
        return example_ != nullptr;
    }

    /// Stores a named local, replacing any previous value.
    template <typename T> void let(const std::string& name, T value) {
        locals_[name] = std::move(value);
    }

    /// Looks up a named local without throwing.
    template <typename T> [[nodiscard]] auto find(const std::string& name) -> Result<T*> {
        auto it = locals_.find(name);
        if (it == locals_.end())
            return "undefined local `" + name + "`";
        T* value = std::any_cast<T>(&it->second);
        if (!value)
            return "local `" + name + "` holds a different type";
        return value;
    }

    /// Returns a named local. Throws `exemplar::Error` if it is missing or
    /// holds a different type.
    template <typename T> [[nodiscard]] auto get(const std::string& name) -> T& {
        auto found = find<T>(name);
        if (is_err(found))
            throw Error(unwrap_err(found));
        return *unwrap(found);
    }

    [[nodiscard]] auto has_local(const std::string& name) const -> bool {
        return locals_.count(name) > 0;
    }

    [[nodiscard]] auto local_count() const -> size_t {
        return locals_.size();
    }

    /// Erases every local.
    void clear_locals();

    /// Marks the running example pending. The body keeps running and is
    /// expected to fail from here on.
    void pending(const std::string& reason = {});

    /// Marks the running example skipped. Return the result from the body:
    ///
    /// ```cpp
    /// [](GroupInstance& ctx) -> Outcome {
    ///     if (!has_network())
    ///         return ctx.skip("no network");
    ///     ...
    ///     return Completed{};
    /// }
    /// ```
    [[nodiscard]] auto skip(const std::string& reason = {}) -> Outcome;

    [[nodiscard]] auto mocks() -> MockLifecycle& {
        return *mocks_;
    }

private:
    friend class Example;

    void bind(Example* example) {
        example_ = example;
    }

    Example* example_ = nullptr;
    std::map<std::string, std::any> locals_;
    Box<MockLifecycle> mocks_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_GROUP_INSTANCE_HPP
