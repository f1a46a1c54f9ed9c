#include "TokenAuthenticator.h"
#include "core/LoggingChannels.h"

namespace Switchboard {
namespace Sandbox {

TokenAuthenticator::TokenAuthenticator(const std::vector<std::string>& allowed)
    : allowed_(allowed.begin(), allowed.end())
{}

Result<Authenticated, AuthenticationFailure> TokenAuthenticator::authenticate(
    const ConnectionRequest& request)
{
    using AuthResult = Result<Authenticated, AuthenticationFailure>;

    auto token = request.queryValue("token");
    if (!token.has_value() || token->empty()) {
        return AuthResult::error(AuthenticationFailure{ 401, "Unauthorized" });
    }
    if (!allowed_.empty() && allowed_.count(token.value()) == 0) {
        LOG_DEBUG(Auth, "Token '{}' is not on the allow-list", token.value());
        return AuthResult::error(AuthenticationFailure{ 403, "Forbidden" });
    }
    return AuthResult::okay(Authenticated{ token });
}

} // namespace Sandbox
} // namespace Switchboard
