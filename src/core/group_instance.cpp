#include "exemplar/core/group_instance.hpp"

#include "exemplar/core/example.hpp"
#include "exemplar/core/pending.hpp"

namespace exemplar::core {

GroupInstance::GroupInstance() : mocks_(make_box<NoMocks>()) {}

GroupInstance::GroupInstance(Box<MockLifecycle> mocks)
    : mocks_(mocks ? std::move(mocks) : make_box<NoMocks>()) {}

Example& GroupInstance::example() const {
    if (!example_)
        throw Error("no example is running in this context");
    return *example_;
}

void GroupInstance::clear_locals() {
    locals_.clear();
}

void GroupInstance::pending(const std::string& reason) {
    pending::mark_pending(example(), reason);
}

Outcome GroupInstance::skip(const std::string& reason) {
    pending::mark_pending(example(), reason);
    return SkippedNow{};
}

} // namespace exemplar::core
