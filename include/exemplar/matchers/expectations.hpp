//! # Expectations and Generated Descriptions
//!
//! Minimal expectation helpers. Each helper records a generated
//! description of what it checked, which the orchestrator uses to describe
//! examples declared without a description:
//!
//! ```cpp
//! group.example("", [](GroupInstance&) { expect_eq(2 + 2, 4); });
//! // described as "is expected to eq 4"
//! ```

#ifndef EXEMPLAR_MATCHERS_EXPECTATIONS_HPP
#define EXEMPLAR_MATCHERS_EXPECTATIONS_HPP

#include "exemplar/common.hpp"

#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace exemplar::matchers {

/// Source of the "last generated description".
class DescriptionSource {
public:
    virtual ~DescriptionSource() = default;

    [[nodiscard]] virtual auto last_generated() const -> std::optional<std::string> = 0;
    virtual void clear() = 0;
};

/// Keeps the most recent description recorded by an expectation helper.
class GeneratedDescriptions : public DescriptionSource {
public:
    /// Process-wide store written by the expectation helpers.
    [[nodiscard]] static auto global() -> Rc<GeneratedDescriptions>;

    void record(std::string description) {
        last_ = std::move(description);
    }

    [[nodiscard]] auto last_generated() const -> std::optional<std::string> override {
        return last_;
    }

    void clear() override {
        last_.reset();
    }

private:
    std::optional<std::string> last_;
};

/// Records into the process-wide store.
void record_generated_description(std::string description);

class ExpectationNotMetError : public Error {
public:
    using Error::Error;
};

/// Expects `actual == expected`.
template <typename A, typename E>
void expect_eq(const A& actual, const E& expected,
               const std::source_location& loc = std::source_location::current()) {
    std::ostringstream description;
    description << "is expected to eq " << expected;
    record_generated_description(description.str());

    if (!(actual == expected)) {
        std::ostringstream message;
        message << "expected: " << expected << "\n     got: " << actual;
        throw ExpectationNotMetError(message.str(), SourceLocation::here(loc));
    }
}

/// Expects `condition` to hold. `description` names what was checked.
void expect_true(bool condition, std::string_view description,
                 const std::source_location& loc = std::source_location::current());

} // namespace exemplar::matchers

#endif // EXEMPLAR_MATCHERS_EXPECTATIONS_HPP
