#include "ValidationIssue.h"

namespace Switchboard {

void to_json(nlohmann::json& j, const ValidationIssue& issue)
{
    j = nlohmann::json{ { "type", issue.type }, { "loc", issue.loc }, { "msg", issue.msg } };
}

std::string describeIssues(const std::vector<ValidationIssue>& issues)
{
    std::string result;
    for (const auto& issue : issues) {
        if (!result.empty()) {
            result += "; ";
        }
        result += issue.type + " at " + issue.loc.dump() + ": " + issue.msg;
    }
    return result;
}

} // namespace Switchboard
