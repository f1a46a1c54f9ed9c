#include "StringCase.h"
#include <cctype>

namespace Switchboard {

std::string toSnakeCase(std::string_view name)
{
    const auto qualifierPos = name.rfind("::");
    if (qualifierPos != std::string_view::npos) {
        name = name.substr(qualifierPos + 2);
    }

    std::string result;
    result.reserve(name.size() + 4);

    for (size_t i = 0; i < name.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(name[i]);
        if (std::isupper(c)) {
            const bool prevLowerOrDigit = i > 0
                && (std::islower(static_cast<unsigned char>(name[i - 1]))
                    || std::isdigit(static_cast<unsigned char>(name[i - 1])));
            const bool acronymEnds = i > 0 && i + 1 < name.size()
                && std::isupper(static_cast<unsigned char>(name[i - 1]))
                && std::islower(static_cast<unsigned char>(name[i + 1]));
            if ((prevLowerOrDigit || acronymEnds) && !result.empty() && result.back() != '_') {
                result.push_back('_');
            }
            result.push_back(static_cast<char>(std::tolower(c)));
        }
        else if (c == '-' || c == ' ') {
            if (!result.empty() && result.back() != '_') {
                result.push_back('_');
            }
        }
        else {
            result.push_back(static_cast<char>(c));
        }
    }

    return result;
}

} // namespace Switchboard
