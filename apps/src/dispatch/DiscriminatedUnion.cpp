#include "DiscriminatedUnion.h"

namespace Switchboard {

DiscriminatedUnion::DiscriminatedUnion(std::string name) : name_(std::move(name))
{}

bool DiscriminatedUnion::add(MessageType type)
{
    const std::string key = type.discriminator;
    return types_.emplace(key, std::move(type)).second;
}

const MessageType* DiscriminatedUnion::find(const std::string& discriminator) const
{
    auto it = types_.find(discriminator);
    return it == types_.end() ? nullptr : &it->second;
}

bool DiscriminatedUnion::contains(const std::string& discriminator) const
{
    return types_.count(discriminator) > 0;
}

std::vector<std::string> DiscriminatedUnion::discriminators() const
{
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& [key, type] : types_) {
        result.push_back(key);
    }
    return result;
}

Result<const MessageType*, std::vector<ValidationIssue>> DiscriminatedUnion::validate(
    const nlohmann::json& message, const std::string& discriminatorField) const
{
    using ResultType = Result<const MessageType*, std::vector<ValidationIssue>>;

    if (!message.is_object()) {
        return ResultType::error({ ValidationIssue{
            IssueType::ModelType,
            nlohmann::json::array(),
            "Input should be an object with a '" + discriminatorField + "' field" } });
    }

    const nlohmann::json tagLoc = nlohmann::json::array({ discriminatorField });

    auto tagIt = message.find(discriminatorField);
    if (tagIt == message.end() || !tagIt->is_string()) {
        return ResultType::error({ ValidationIssue{
            IssueType::MissingDiscriminator,
            tagLoc,
            "Unable to extract tag using discriminator '" + discriminatorField + "'" } });
    }

    const std::string& tag = tagIt->get_ref<const std::string&>();
    const MessageType* type = find(tag);
    if (!type) {
        std::string expected;
        for (const auto& [key, candidate] : types_) {
            if (!expected.empty()) {
                expected += ", ";
            }
            expected += "'" + key + "'";
        }
        return ResultType::error({ ValidationIssue{
            IssueType::UnknownDiscriminator,
            tagLoc,
            "Input tag '" + tag + "' found using '" + discriminatorField
                + "' does not match any of the expected tags: " + expected } });
    }

    std::vector<ValidationIssue> issues;
    if (!type->shape.validate(message, nlohmann::json::array(), issues)) {
        return ResultType::error(std::move(issues));
    }

    return ResultType::okay(type);
}

} // namespace Switchboard
