#pragma once

#include "AuthenticatorInterface.h"
#include "ConsumerConfig.h"
#include "HandlerTable.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

class Connection;
class HandlerContext;

/**
 * @brief One connection class: its handlers, configuration and connect-time hooks.
 *
 * Assembled once at startup and then shared read-only by every ConnectionTask
 * serving it.
 */
class Consumer {
public:
    // Groups a freshly authenticated connection joins.
    using GroupBuilder = std::function<std::vector<std::string>(const Connection&)>;
    using PostAuthenticationHook = std::function<void(HandlerContext&)>;

    Consumer(std::string name, ConsumerConfig config, std::shared_ptr<const HandlerTable> handlers);

    Consumer& setAuthenticator(std::shared_ptr<AuthenticatorInterface> authenticator);
    Consumer& setGroupBuilder(GroupBuilder builder);
    Consumer& setPostAuthentication(PostAuthenticationHook hook);

    const std::string& name() const { return name_; }
    const std::shared_ptr<const ConsumerConfig>& config() const { return config_; }
    const std::shared_ptr<const HandlerTable>& handlers() const { return handlers_; }
    AuthenticatorInterface& authenticator() const { return *authenticator_; }

    std::vector<std::string> buildGroups(const Connection& connection) const;
    const PostAuthenticationHook& postAuthentication() const { return postAuthentication_; }

private:
    std::string name_;
    std::shared_ptr<const ConsumerConfig> config_;
    std::shared_ptr<const HandlerTable> handlers_;
    std::shared_ptr<AuthenticatorInterface> authenticator_;
    GroupBuilder groupBuilder_;
    PostAuthenticationHook postAuthentication_;
};

} // namespace Switchboard
