#pragma once

#include "Connection.h"
#include "core/Result.h"
#include <optional>
#include <string>

namespace Switchboard {

struct Authenticated {
    // Absent for anonymous connections.
    std::optional<std::string> identity;
};

struct AuthenticationFailure {
    int statusCode = 403;
    std::string statusText = "Forbidden";
};

/**
 * @brief Decides whether a connection request may proceed and who it belongs to.
 */
class AuthenticatorInterface {
public:
    virtual ~AuthenticatorInterface() = default;

    virtual Result<Authenticated, AuthenticationFailure> authenticate(
        const ConnectionRequest& request) = 0;
};

// Accepts every request as anonymous.
class AllowAnyAuthenticator : public AuthenticatorInterface {
public:
    Result<Authenticated, AuthenticationFailure> authenticate(const ConnectionRequest&) override
    {
        return Result<Authenticated, AuthenticationFailure>::okay(Authenticated{});
    }
};

} // namespace Switchboard
