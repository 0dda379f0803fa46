//! # Example Metadata
//!
//! Typed identity record for groups and examples. Replaces dynamic key/value
//! metadata with a fixed set of named fields plus a free-form tag map.
//!
//! Group metadata forms a parent chain shared by reference. Example metadata
//! is derived from its group once, at construction; afterwards only the
//! pending flag, the description arguments and the execution result change.

#ifndef EXEMPLAR_CORE_METADATA_HPP
#define EXEMPLAR_CORE_METADATA_HPP

#include "exemplar/common.hpp"
#include "exemplar/core/execution_result.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exemplar::core {

using Tags = std::map<std::string, std::string>;

/// Metadata of a declared example group.
struct GroupMetadata {
    std::string description;
    SourceLocation location;
    Tags tags;
    Rc<const GroupMetadata> parent;

    /// Descriptions of this group and its ancestors, outermost first,
    /// joined by a space.
    [[nodiscard]] auto full_description() const -> std::string;

    /// Looks up a tag on this group, then on its ancestors.
    [[nodiscard]] auto tag(const std::string& key) const -> std::optional<std::string>;
};

/// Options given when declaring an example.
struct ExampleOptions {
    /// Declared pending. An empty string means "pending, no reason given".
    std::optional<std::string> pending;

    /// Declared skipped. An empty string means "skipped, no reason given".
    std::optional<std::string> skip;

    Tags tags;

    [[nodiscard]] static auto pending_because(std::string reason = {}) -> ExampleOptions {
        ExampleOptions options;
        options.pending = std::move(reason);
        return options;
    }

    [[nodiscard]] static auto skipped_because(std::string reason = {}) -> ExampleOptions {
        ExampleOptions options;
        options.skip = std::move(reason);
        return options;
    }
};

class Metadata {
public:
    /// Derives example metadata from the declaring group's metadata.
    [[nodiscard]] static auto for_example(Rc<const GroupMetadata> group, std::string description,
                                          const ExampleOptions& options, SourceLocation location)
        -> Metadata;

    [[nodiscard]] auto group() const -> const Rc<const GroupMetadata>& {
        return group_;
    }

    /// Description arguments; a generated description is appended here when
    /// the example was declared without one.
    [[nodiscard]] auto description_args() const -> const std::vector<std::string>& {
        return description_args_;
    }
    [[nodiscard]] auto description_args() -> std::vector<std::string>& {
        return description_args_;
    }

    /// Description arguments joined by a space. Empty if none were given.
    [[nodiscard]] auto description() const -> std::string;

    /// Group chain description followed by this example's description.
    [[nodiscard]] auto full_description() const -> std::string;

    [[nodiscard]] auto source_location() const -> const SourceLocation& {
        return location_;
    }

    [[nodiscard]] auto file_path() const -> const std::string& {
        return location_.file;
    }

    [[nodiscard]] auto line_number() const -> uint32_t {
        return location_.line;
    }

    /// `file:line` of the declaration.
    [[nodiscard]] auto location() const -> std::string {
        return location_.to_string();
    }

    [[nodiscard]] auto pending() const -> bool {
        return pending_;
    }
    void set_pending(bool pending) {
        pending_ = pending;
    }

    [[nodiscard]] auto skip() const -> const std::optional<std::string>& {
        return skip_;
    }
    void set_skip(std::string reason) {
        skip_ = std::move(reason);
    }

    /// Example tags, overriding group tags of the same key.
    [[nodiscard]] auto tag(const std::string& key) const -> std::optional<std::string>;

    [[nodiscard]] auto tags() const -> const Tags& {
        return tags_;
    }

    [[nodiscard]] auto execution_result() const -> const ExecutionResult& {
        return execution_result_;
    }
    [[nodiscard]] auto execution_result() -> ExecutionResult& {
        return execution_result_;
    }

private:
    Metadata() = default;

    Rc<const GroupMetadata> group_;
    std::vector<std::string> description_args_;
    SourceLocation location_;
    bool pending_ = false;
    std::optional<std::string> skip_;
    Tags tags_;
    ExecutionResult execution_result_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_METADATA_HPP
