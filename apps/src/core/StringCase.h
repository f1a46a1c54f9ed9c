#pragma once

#include <string>
#include <string_view>

namespace Switchboard {

/**
 * @brief Converts CamelCase / mixedCase identifiers to snake_case.
 *
 * Namespace qualifiers are stripped first, so "Chat::JobDoneEvent" becomes
 * "job_done_event". Acronym runs stay together: "HTTPRequest" -> "http_request".
 */
std::string toSnakeCase(std::string_view name);

} // namespace Switchboard
