#include "Consumer.h"
#include "Connection.h"

namespace Switchboard {

Consumer::Consumer(
    std::string name, ConsumerConfig config, std::shared_ptr<const HandlerTable> handlers)
    : name_(std::move(name)),
      config_(std::make_shared<const ConsumerConfig>(std::move(config))),
      handlers_(std::move(handlers)),
      authenticator_(std::make_shared<AllowAnyAuthenticator>())
{}

Consumer& Consumer::setAuthenticator(std::shared_ptr<AuthenticatorInterface> authenticator)
{
    if (!authenticator) {
        authenticator = std::make_shared<AllowAnyAuthenticator>();
    }
    authenticator_ = std::move(authenticator);
    return *this;
}

Consumer& Consumer::setGroupBuilder(GroupBuilder builder)
{
    groupBuilder_ = std::move(builder);
    return *this;
}

Consumer& Consumer::setPostAuthentication(PostAuthenticationHook hook)
{
    postAuthentication_ = std::move(hook);
    return *this;
}

std::vector<std::string> Consumer::buildGroups(const Connection& connection) const
{
    if (!groupBuilder_) {
        return {};
    }
    return groupBuilder_(connection);
}

} // namespace Switchboard
