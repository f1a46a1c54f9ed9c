#pragma once

#include "ValidationIssue.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Messages the framework itself sends to clients.
 *
 * Every builder takes the consumer's discriminator field so the markers use the
 * same key as application messages.
 */
namespace SystemMessages {

inline constexpr const char* kError = "error";
inline constexpr const char* kComplete = "complete";
inline constexpr const char* kGroupComplete = "group_complete";
inline constexpr const char* kAuthentication = "authentication";
inline constexpr const char* kHandlerFailureText = "Failed to process message";

nlohmann::json error(const std::string& field, const std::vector<ValidationIssue>& issues);

// Generic error for an exception escaping a handler. Carries no exception detail.
nlohmann::json handlerError(const std::string& field);

nlohmann::json complete(const std::string& field);
nlohmann::json groupComplete(const std::string& field);

nlohmann::json authentication(const std::string& field, int statusCode, const std::string& statusText);

} // namespace SystemMessages
} // namespace Switchboard
