//! # Pipeline Outcome
//!
//! The result of running an example body, returned up the pipeline instead
//! of raising internal signals:
//!
//! | Variant        | Meaning                                             |
//! |----------------|-----------------------------------------------------|
//! | `Completed`    | Body returned normally                              |
//! | `Failed`       | Body reported (or threw) a failure                  |
//! | `SkippedNow`   | Body called `skip()`; bookkeeping is already done   |
//! | `PendingFixed` | Pending example passed; carries the synthesized error |

#ifndef EXEMPLAR_CORE_OUTCOME_HPP
#define EXEMPLAR_CORE_OUTCOME_HPP

#include "exemplar/core/failure.hpp"

#include <variant>

namespace exemplar::core {

struct Completed {};

struct Failed {
    Failure failure;
};

struct SkippedNow {};

struct PendingFixed {
    Failure failure;
};

using Outcome = std::variant<Completed, Failed, SkippedNow, PendingFixed>;

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_OUTCOME_HPP
