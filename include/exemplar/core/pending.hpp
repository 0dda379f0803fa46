//! # Pending Policy
//!
//! Pending and skip bookkeeping shared by declaration-time directives, the
//! dynamic `pending()`/`skip()` calls made from a body, and the orchestrator.
//!
//! A pending example is expected to fail. If its body completes, the
//! example is "fixed": it is reported as failed with a
//! `PendingExampleFixedError`.

#ifndef EXEMPLAR_CORE_PENDING_HPP
#define EXEMPLAR_CORE_PENDING_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/outcome.hpp"

#include <string>

namespace exemplar::core {

class Example;

/// Raised (as a value) when a pending example passes.
class PendingExampleFixedError : public Error {
public:
    using Error::Error;
};

namespace pending {

constexpr const char* kNoReasonGiven = "No reason given";
constexpr const char* kNotYetImplemented = "Not yet implemented";
constexpr const char* kFixedMessage = "Expected example to fail since it is pending, but it passed.";

/// Marks `example` pending: sets the pending flag, records the pending
/// message (`reason`, or "No reason given" when empty) and resets
/// `pending_fixed` to false.
void mark_pending(Example& example, const std::string& reason);

/// Records that a pending example passed. Clears the pending flag so the
/// synthesized error is reported as the example's failure.
void mark_fixed(Example& example);

/// `mark_fixed` plus the error to report, located at the example's
/// declaration.
[[nodiscard]] auto fixed(Example& example) -> PendingFixed;

} // namespace pending

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_PENDING_HPP
