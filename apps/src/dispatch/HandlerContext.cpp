#include "HandlerContext.h"

namespace Switchboard {

HandlerContext::HandlerContext(
    Connection& connection,
    ChannelLayerInterface& channelLayer,
    GroupBroadcaster& broadcaster,
    const EventEnvelope* event)
    : connection_(connection), channelLayer_(channelLayer), broadcaster_(broadcaster), event_(event)
{}

void HandlerContext::sendJson(const nlohmann::json& message)
{
    check(connection_.send(message));
}

void HandlerContext::broadcastJson(
    const nlohmann::json& message, std::optional<std::vector<std::string>> groups, bool excludeOrigin)
{
    auto sent = broadcaster_.broadcast(connection_, message, std::move(groups), excludeOrigin);
    if (sent.isError()) {
        throw TransportException(sent.errorValue());
    }
    if (sent.value() > 0) {
        ++broadcastCount_;
    }
}

void HandlerContext::joinGroup(const std::string& group)
{
    check(broadcaster_.join(connection_, group));
}

void HandlerContext::leaveGroup(const std::string& group)
{
    check(broadcaster_.leave(connection_, group));
}

void HandlerContext::sendEventJson(const std::string& channel, const nlohmann::json& event)
{
    auto envelope = EventEnvelope::unicast(channel, event);
    envelope.from(connection_.id(), connection_.identity());
    check(channelLayer_.sendEvent(channel, envelope));
}

void HandlerContext::broadcastEventJson(const std::string& group, const nlohmann::json& event)
{
    auto envelope = EventEnvelope::broadcast(group, event);
    envelope.from(connection_.id(), connection_.identity());
    check(channelLayer_.broadcastEvent(group, envelope));
}

void HandlerContext::check(const Result<std::monostate, TransportError>& result) const
{
    if (result.isError()) {
        throw TransportException(result.errorValue());
    }
}

} // namespace Switchboard
