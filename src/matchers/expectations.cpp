#include "exemplar/matchers/expectations.hpp"

namespace exemplar::matchers {

Rc<GeneratedDescriptions> GeneratedDescriptions::global() {
    static Rc<GeneratedDescriptions> store = make_rc<GeneratedDescriptions>();
    return store;
}

void record_generated_description(std::string description) {
    GeneratedDescriptions::global()->record(std::move(description));
}

void expect_true(bool condition, std::string_view description, const std::source_location& loc) {
    record_generated_description("is expected to " + std::string(description));
    if (!condition)
        throw ExpectationNotMetError("expected " + std::string(description) + " to hold",
                                     SourceLocation::here(loc));
}

} // namespace exemplar::matchers
