#include "SystemMessages.h"

namespace Switchboard {
namespace SystemMessages {

nlohmann::json error(const std::string& field, const std::vector<ValidationIssue>& issues)
{
    nlohmann::json payload = nlohmann::json::array();
    for (const auto& issue : issues) {
        payload.push_back(issue);
    }
    return { { field, kError }, { "payload", payload } };
}

nlohmann::json handlerError(const std::string& field)
{
    return error(
        field,
        { ValidationIssue{ IssueType::HandlerError, nlohmann::json::array(), kHandlerFailureText } });
}

nlohmann::json complete(const std::string& field)
{
    return { { field, kComplete } };
}

nlohmann::json groupComplete(const std::string& field)
{
    return { { field, kGroupComplete } };
}

nlohmann::json authentication(const std::string& field, int statusCode, const std::string& statusText)
{
    return { { field, kAuthentication },
             { "payload", { { "status_code", statusCode }, { "status_text", statusText } } } };
}

} // namespace SystemMessages
} // namespace Switchboard
