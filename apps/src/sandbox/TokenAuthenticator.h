#pragma once

#include "dispatch/AuthenticatorInterface.h"
#include <set>
#include <string>
#include <vector>

namespace Switchboard {
namespace Sandbox {

/**
 * @brief Authenticates by the ?token= query parameter; the token is the identity.
 *
 * With an empty allow-list any non-empty token is accepted.
 */
class TokenAuthenticator : public AuthenticatorInterface {
public:
    explicit TokenAuthenticator(const std::vector<std::string>& allowed = {});

    Result<Authenticated, AuthenticationFailure> authenticate(const ConnectionRequest& request) override;

private:
    std::set<std::string> allowed_;
};

} // namespace Sandbox
} // namespace Switchboard
