//! # Current Example
//!
//! Process-wide "currently running example" marker, read by collaborators
//! that have no example passed to them (the warnings helper, description
//! generation). Only one example runs at a time; the marker is set for the
//! duration of `Example::run` and restored on every exit path.

#ifndef EXEMPLAR_CORE_CURRENT_EXAMPLE_HPP
#define EXEMPLAR_CORE_CURRENT_EXAMPLE_HPP

namespace exemplar::core {

class Example;

/// The running example, or null between runs.
[[nodiscard]] auto current_example() -> const Example*;

/// Publishes an example as current for the lifetime of the scope.
class CurrentExampleScope {
public:
    explicit CurrentExampleScope(const Example& example);
    ~CurrentExampleScope();

    CurrentExampleScope(const CurrentExampleScope&) = delete;
    CurrentExampleScope& operator=(const CurrentExampleScope&) = delete;

private:
    const Example* previous_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_CURRENT_EXAMPLE_HPP
