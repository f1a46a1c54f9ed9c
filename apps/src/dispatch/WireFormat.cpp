#include "WireFormat.h"

namespace Switchboard {
namespace WireFormat {

Result<nlohmann::json, ValidationIssue> parseText(const std::string& text)
{
    try {
        return Result<nlohmann::json, ValidationIssue>::okay(nlohmann::json::parse(text));
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, ValidationIssue>::error(ValidationIssue{
            IssueType::JsonInvalid,
            nlohmann::json::array(),
            std::string("Invalid JSON: ") + e.what() });
    }
}

std::optional<std::string> discriminatorOf(
    const nlohmann::json& message, const std::string& discriminatorField)
{
    if (!message.is_object()) {
        return std::nullopt;
    }
    auto it = message.find(discriminatorField);
    if (it == message.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string logLabel(const nlohmann::json& message, const std::string& discriminatorField)
{
    return discriminatorOf(message, discriminatorField).value_or("<none>");
}

std::string serialize(const nlohmann::json& message)
{
    // Replace invalid UTF-8 rather than throwing from deep inside a send.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace WireFormat
} // namespace Switchboard
