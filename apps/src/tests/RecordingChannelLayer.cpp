#include "tests/RecordingChannelLayer.h"

namespace Switchboard::Tests {

RecordingChannelLayer::RecordingChannelLayer(std::shared_ptr<ChannelLayerInterface> inner)
    : inner_(std::move(inner))
{}

ChannelLayerInterface::Status RecordingChannelLayer::registerChannel(
    const std::string& channel, std::weak_ptr<ChannelReceiverInterface> receiver)
{
    return inner_->registerChannel(channel, std::move(receiver));
}

ChannelLayerInterface::Status RecordingChannelLayer::unregisterChannel(const std::string& channel)
{
    return inner_->unregisterChannel(channel);
}

ChannelLayerInterface::Status RecordingChannelLayer::sendToConnection(
    const std::string& channel, const nlohmann::json& message)
{
    return inner_->sendToConnection(channel, message);
}

ChannelLayerInterface::Status RecordingChannelLayer::joinGroup(
    const std::string& group, const std::string& channel)
{
    return inner_->joinGroup(group, channel);
}

ChannelLayerInterface::Status RecordingChannelLayer::leaveGroup(
    const std::string& group, const std::string& channel)
{
    return inner_->leaveGroup(group, channel);
}

ChannelLayerInterface::Status RecordingChannelLayer::sendToGroup(
    const std::string& group, const GroupEnvelope& envelope)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GroupEnvelope recorded = envelope;
        recorded.group = group;
        groupSends_.push_back(std::move(recorded));
    }
    return inner_->sendToGroup(group, envelope);
}

ChannelLayerInterface::Status RecordingChannelLayer::sendEvent(
    const std::string& channel, const EventEnvelope& envelope)
{
    bool suppress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(RecordedEvent{ EventDispatchMode::Unicast, channel, envelope });
        suppress = suppressEvents_;
    }
    if (suppress) {
        return Status::okay(std::monostate{});
    }
    return inner_->sendEvent(channel, envelope);
}

ChannelLayerInterface::Status RecordingChannelLayer::broadcastEvent(
    const std::string& group, const EventEnvelope& envelope)
{
    bool suppress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(RecordedEvent{ EventDispatchMode::Broadcast, group, envelope });
        suppress = suppressEvents_;
    }
    if (suppress) {
        return Status::okay(std::monostate{});
    }
    return inner_->broadcastEvent(group, envelope);
}

void RecordingChannelLayer::setSuppressEvents(bool suppress)
{
    std::lock_guard<std::mutex> lock(mutex_);
    suppressEvents_ = suppress;
}

std::vector<RecordingChannelLayer::RecordedEvent> RecordingChannelLayer::events() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<GroupEnvelope> RecordingChannelLayer::groupSends() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return groupSends_;
}

} // namespace Switchboard::Tests
