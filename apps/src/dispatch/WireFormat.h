#pragma once

#include "ValidationIssue.h"
#include "core/Result.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Switchboard {
namespace WireFormat {

/**
 * @brief Parses one inbound text frame. Invalid JSON yields a json_invalid issue.
 */
Result<nlohmann::json, ValidationIssue> parseText(const std::string& text);

// Discriminator value of a message, if present and a string.
std::optional<std::string> discriminatorOf(
    const nlohmann::json& message, const std::string& discriminatorField);

// Discriminator for log lines: the value, or "<none>".
std::string logLabel(const nlohmann::json& message, const std::string& discriminatorField);

std::string serialize(const nlohmann::json& message);

} // namespace WireFormat
} // namespace Switchboard
