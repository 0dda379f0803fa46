#include "exemplar/core/pending.hpp"

#include "exemplar/core/example.hpp"
#include "exemplar/log/log.hpp"

namespace exemplar::core::pending {

void mark_pending(Example& example, const std::string& reason) {
    const std::string message = reason.empty() ? kNoReasonGiven : reason;
    EXEMPLAR_LOG_DEBUG("pending", example.full_description() << ": " << message);

    auto& metadata = example.metadata();
    metadata.set_pending(true);
    metadata.execution_result().set_pending_message(message);
    metadata.execution_result().set_pending_fixed(false);
}

void mark_fixed(Example& example) {
    auto& metadata = example.metadata();
    metadata.set_pending(false);
    metadata.execution_result().set_pending_fixed(true);
}

PendingFixed fixed(Example& example) {
    mark_fixed(example);
    EXEMPLAR_LOG_DEBUG("pending", example.full_description() << " passed while pending");
    return PendingFixed{
        Failure::make(PendingExampleFixedError(kFixedMessage, example.source_location()))};
}

} // namespace exemplar::core::pending
