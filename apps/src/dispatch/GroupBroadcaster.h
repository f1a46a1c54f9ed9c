#pragma once

#include "ChannelLayerInterface.h"
#include "Connection.h"
#include "ConsumerConfig.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Group membership and broadcast fan-out with per-recipient relevance flags.
 *
 * Sending side: broadcast() issues one channel-layer group send per target group
 * and hands the origin its own copy directly, so that copy precedes the origin's
 * completion markers. Receiving side: deliver() stamps isMine / isCurrent for
 * the recipient and skips the origin, which already has its copy.
 */
class GroupBroadcaster {
public:
    using Status = Result<std::monostate, TransportError>;
    // Number of group sends issued.
    using FanOut = Result<size_t, TransportError>;

    GroupBroadcaster(ChannelLayerInterface& channelLayer, std::shared_ptr<const ConsumerConfig> config);

    Status join(Connection& connection, const std::string& group);
    Status leave(Connection& connection, const std::string& group);
    Status leaveAll(Connection& connection);

    /**
     * @brief Broadcasts a message to groups.
     * @param groups Target groups; defaults to the origin's current memberships.
     * @param excludeOrigin When true the origin receives nothing.
     * @return Group sends issued; zero when there was no target group.
     */
    FanOut broadcast(
        Connection& origin,
        const nlohmann::json& message,
        std::optional<std::vector<std::string>> groups = std::nullopt,
        bool excludeOrigin = false);

    // Recipient side of a group send.
    Status deliver(Connection& recipient, const GroupEnvelope& envelope);

    // True iff both identities are present and equal.
    static bool isMine(
        const std::optional<std::string>& recipientIdentity,
        const std::optional<std::string>& originIdentity);

    static nlohmann::json enrich(const nlohmann::json& content, bool isMine, bool isCurrent);

private:
    ChannelLayerInterface& channelLayer_;
    std::shared_ptr<const ConsumerConfig> config_;
};

} // namespace Switchboard
