#pragma once

#include "ChannelLayerInterface.h"
#include "Connection.h"
#include "Envelopes.h"
#include "GroupBroadcaster.h"
#include "MessageTraits.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief What a handler sees of its connection and of the channel layer.
 *
 * One context per handler invocation. Every helper throws TransportException on
 * a channel-layer or socket failure.
 */
class HandlerContext {
public:
    HandlerContext(
        Connection& connection,
        ChannelLayerInterface& channelLayer,
        GroupBroadcaster& broadcaster,
        const EventEnvelope* event = nullptr);

    Connection& connection() { return connection_; }
    const Connection& connection() const { return connection_; }
    const std::optional<std::string>& identity() const { return connection_.identity(); }
    const ConsumerConfig& config() const { return connection_.config(); }
    const std::string& discriminatorField() const { return config().discriminatorField; }

    // Set while handling an event; null for client messages.
    const EventEnvelope* event() const { return event_; }

    void sendJson(const nlohmann::json& message);

    template <typename T>
    void send(const T& message)
    {
        sendJson(encodeMessage(message, discriminatorField()));
    }

    void broadcastJson(
        const nlohmann::json& message,
        std::optional<std::vector<std::string>> groups = std::nullopt,
        bool excludeOrigin = false);

    template <typename T>
    void broadcast(
        const T& message,
        std::optional<std::vector<std::string>> groups = std::nullopt,
        bool excludeOrigin = false)
    {
        broadcastJson(encodeMessage(message, discriminatorField()), std::move(groups), excludeOrigin);
    }

    void joinGroup(const std::string& group);
    void leaveGroup(const std::string& group);

    void sendEventJson(const std::string& channel, const nlohmann::json& event);

    template <typename T>
    void sendEvent(const std::string& channel, const T& event)
    {
        sendEventJson(channel, encodeMessage(event, discriminatorField()));
    }

    void broadcastEventJson(const std::string& group, const nlohmann::json& event);

    template <typename T>
    void broadcastEvent(const std::string& group, const T& event)
    {
        broadcastEventJson(group, encodeMessage(event, discriminatorField()));
    }

    // Broadcasts through this context that reached at least one group.
    size_t broadcastCount() const { return broadcastCount_; }

private:
    void check(const Result<std::monostate, TransportError>& result) const;

    Connection& connection_;
    ChannelLayerInterface& channelLayer_;
    GroupBroadcaster& broadcaster_;
    const EventEnvelope* event_;
    size_t broadcastCount_ = 0;
};

} // namespace Switchboard
