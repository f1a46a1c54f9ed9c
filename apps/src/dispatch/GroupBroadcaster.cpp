#include "GroupBroadcaster.h"
#include "SystemMessages.h"
#include "WireFormat.h"
#include "core/LoggingChannels.h"

namespace Switchboard {

GroupBroadcaster::GroupBroadcaster(
    ChannelLayerInterface& channelLayer, std::shared_ptr<const ConsumerConfig> config)
    : channelLayer_(channelLayer),
      config_(config ? std::move(config) : std::make_shared<const ConsumerConfig>())
{}

GroupBroadcaster::Status GroupBroadcaster::join(Connection& connection, const std::string& group)
{
    auto result = channelLayer_.joinGroup(group, connection.id());
    if (result.isError()) {
        return result;
    }
    if (connection.addGroup(group)) {
        LOG_DEBUG(Groups, "{} joined group {}", connection.id(), group);
    }
    return result;
}

GroupBroadcaster::Status GroupBroadcaster::leave(Connection& connection, const std::string& group)
{
    auto result = channelLayer_.leaveGroup(group, connection.id());
    if (result.isError()) {
        return result;
    }
    if (connection.removeGroup(group)) {
        LOG_DEBUG(Groups, "{} left group {}", connection.id(), group);
    }
    return result;
}

GroupBroadcaster::Status GroupBroadcaster::leaveAll(Connection& connection)
{
    const std::vector<std::string> groups(connection.groups().begin(), connection.groups().end());
    Status status = Status::okay(std::monostate{});
    for (const auto& group : groups) {
        auto result = leave(connection, group);
        if (result.isError() && status.isValue()) {
            status = result;
        }
    }
    return status;
}

GroupBroadcaster::FanOut GroupBroadcaster::broadcast(
    Connection& origin,
    const nlohmann::json& message,
    std::optional<std::vector<std::string>> groups,
    bool excludeOrigin)
{
    const std::vector<std::string> targets = groups.has_value()
        ? std::move(groups.value())
        : std::vector<std::string>(origin.groups().begin(), origin.groups().end());

    const std::string tag = WireFormat::logLabel(message, config_->discriminatorField);
    if (targets.empty()) {
        LOG_DEBUG(Groups, "Broadcast '{}' from {} has no target groups", tag, origin.id());
        return FanOut::okay(0);
    }

    GroupEnvelope envelope;
    envelope.content = message;
    envelope.originChannel = origin.id();
    envelope.originIdentity = origin.identity();
    envelope.excludeOrigin = excludeOrigin;

    bool originIsRecipient = false;
    for (const auto& group : targets) {
        LOG_DEBUG(Groups, "Broadcast '{}' from {} to {}", tag, origin.id(), group);
        auto result = channelLayer_.sendToGroup(group, envelope);
        if (result.isError()) {
            LOG_ERROR(
                Groups, "Group send to {} failed: {}", group, result.errorValue().toString());
            return FanOut::error(result.errorValue());
        }
        originIsRecipient = originIsRecipient || origin.isMember(group);
    }

    if (originIsRecipient && !excludeOrigin) {
        const bool mine = isMine(origin.identity(), origin.identity());
        auto sent = origin.send(enrich(message, mine, true));
        if (sent.isError()) {
            return FanOut::error(sent.errorValue());
        }
    }

    return FanOut::okay(targets.size());
}

GroupBroadcaster::Status GroupBroadcaster::deliver(
    Connection& recipient, const GroupEnvelope& envelope)
{
    if (recipient.id() == envelope.originChannel) {
        LOG_TRACE(Groups, "{} skips its own group message", recipient.id());
        return Status::okay(std::monostate{});
    }

    const bool mine = isMine(recipient.identity(), envelope.originIdentity);
    auto result = recipient.send(enrich(envelope.content, mine, false));
    if (result.isError()) {
        return result;
    }

    if (config_->completionSignalsEnabled) {
        return recipient.send(SystemMessages::groupComplete(config_->discriminatorField));
    }
    return result;
}

bool GroupBroadcaster::isMine(
    const std::optional<std::string>& recipientIdentity,
    const std::optional<std::string>& originIdentity)
{
    return recipientIdentity.has_value() && originIdentity.has_value()
        && recipientIdentity.value() == originIdentity.value();
}

nlohmann::json GroupBroadcaster::enrich(const nlohmann::json& content, bool isMine, bool isCurrent)
{
    nlohmann::json enriched = content.is_object() ? content : nlohmann::json{ { "payload", content } };
    enriched["isMine"] = isMine;
    enriched["isCurrent"] = isCurrent;
    return enriched;
}

} // namespace Switchboard
