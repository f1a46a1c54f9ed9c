#pragma once

#include "Envelopes.h"
#include "Errors.h"
#include "core/Result.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace Switchboard {

/**
 * @brief Receiving end of a channel: what the channel layer calls to deliver.
 *
 * Implementations must not block; ConnectionTask just queues the work.
 */
class ChannelReceiverInterface {
public:
    virtual ~ChannelReceiverInterface() = default;

    virtual void deliverMessage(const nlohmann::json& message) = 0;
    virtual void deliverGroupMessage(const GroupEnvelope& envelope) = 0;
    virtual void deliverEvent(const EventEnvelope& envelope) = 0;
};

/**
 * @brief Transport contract between connections, groups and outside code.
 *
 * Channels are connection ids. Sending to an empty or unknown group succeeds
 * without delivering anything; sending to an unknown channel fails.
 */
class ChannelLayerInterface {
public:
    using Status = Result<std::monostate, TransportError>;

    virtual ~ChannelLayerInterface() = default;

    virtual Status registerChannel(
        const std::string& channel, std::weak_ptr<ChannelReceiverInterface> receiver) = 0;
    virtual Status unregisterChannel(const std::string& channel) = 0;

    virtual Status sendToConnection(const std::string& channel, const nlohmann::json& message) = 0;

    virtual Status joinGroup(const std::string& group, const std::string& channel) = 0;
    virtual Status leaveGroup(const std::string& group, const std::string& channel) = 0;
    virtual Status sendToGroup(const std::string& group, const GroupEnvelope& envelope) = 0;

    virtual Status sendEvent(const std::string& channel, const EventEnvelope& envelope) = 0;
    virtual Status broadcastEvent(const std::string& group, const EventEnvelope& envelope) = 0;
};

} // namespace Switchboard
