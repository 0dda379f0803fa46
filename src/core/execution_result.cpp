#include "exemplar/core/execution_result.hpp"

namespace exemplar::core {

const char* status_name(Status status) {
    switch (status) {
    case Status::NotStarted:
        return "not_started";
    case Status::Started:
        return "started";
    case Status::Passed:
        return "passed";
    case Status::Failed:
        return "failed";
    case Status::Pending:
        return "pending";
    }
    return "unknown";
}

bool is_terminal(Status status) {
    return status == Status::Passed || status == Status::Failed || status == Status::Pending;
}

double ExecutionResult::run_time_seconds() const {
    return run_time_ ? to_seconds(*run_time_) : 0.0;
}

bool ExecutionResult::record_started(Timestamp at) {
    if (status_ != Status::NotStarted)
        return false;

    status_ = Status::Started;
    started_at_ = at;
    return true;
}

bool ExecutionResult::record_finished(Status status, Timestamp at) {
    if (status_ != Status::Started || !is_terminal(status) || !started_at_)
        return false;

    // A clock that stepped backwards must not produce a negative run time.
    if (at < *started_at_)
        at = *started_at_;

    status_ = status;
    finished_at_ = at;
    run_time_ = at - *started_at_;
    return true;
}

} // namespace exemplar::core
