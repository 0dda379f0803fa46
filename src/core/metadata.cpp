#include "exemplar/core/metadata.hpp"

#include <vector>

namespace exemplar::core {

std::string GroupMetadata::full_description() const {
    std::vector<const GroupMetadata*> chain;
    for (const GroupMetadata* group = this; group; group = group->parent.get())
        chain.push_back(group);

    std::string result;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if ((*it)->description.empty())
            continue;
        if (!result.empty())
            result += ' ';
        result += (*it)->description;
    }
    return result;
}

std::optional<std::string> GroupMetadata::tag(const std::string& key) const {
    for (const GroupMetadata* group = this; group; group = group->parent.get()) {
        auto it = group->tags.find(key);
        if (it != group->tags.end())
            return it->second;
    }
    return std::nullopt;
}

Metadata Metadata::for_example(Rc<const GroupMetadata> group, std::string description,
                               const ExampleOptions& options, SourceLocation location) {
    Metadata metadata;
    metadata.group_ = std::move(group);
    if (!description.empty())
        metadata.description_args_.push_back(std::move(description));
    metadata.location_ = std::move(location);
    metadata.skip_ = options.skip;
    metadata.tags_ = options.tags;
    return metadata;
}

std::string Metadata::description() const {
    std::string result;
    for (const auto& arg : description_args_) {
        if (arg.empty())
            continue;
        if (!result.empty())
            result += ' ';
        result += arg;
    }
    return result;
}

std::string Metadata::full_description() const {
    std::string result = group_ ? group_->full_description() : std::string{};
    std::string own = description();
    if (!own.empty()) {
        if (!result.empty())
            result += ' ';
        result += own;
    }
    return result;
}

std::optional<std::string> Metadata::tag(const std::string& key) const {
    auto it = tags_.find(key);
    if (it != tags_.end())
        return it->second;
    if (group_)
        return group_->tag(key);
    return std::nullopt;
}

} // namespace exemplar::core
