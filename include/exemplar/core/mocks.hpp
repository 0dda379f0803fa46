//! # Mocking Lifecycle
//!
//! The three calls the engine makes into a mocking collaborator around every
//! example: `setup` before the `before(:each)` hooks, `verify` after the
//! `after(:each)` hooks, and `teardown` last. Any of them may throw.

#ifndef EXEMPLAR_CORE_MOCKS_HPP
#define EXEMPLAR_CORE_MOCKS_HPP

namespace exemplar::core {

class MockLifecycle {
public:
    virtual ~MockLifecycle() = default;

    virtual void setup() = 0;
    virtual void verify() = 0;
    virtual void teardown() = 0;
};

/// Used when no mocking library is plugged in.
class NoMocks : public MockLifecycle {
public:
    void setup() override {}
    void verify() override {}
    void teardown() override {}
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_MOCKS_HPP
