#include "InMemoryChannelLayer.h"
#include "core/LoggingChannels.h"

namespace Switchboard {

namespace {
ChannelLayerInterface::Status okay()
{
    return ChannelLayerInterface::Status::okay(std::monostate{});
}

ChannelLayerInterface::Status failure(
    const std::string& operation, const std::string& target, const std::string& message)
{
    return ChannelLayerInterface::Status::error(TransportError{ operation, target, message });
}
} // namespace

ChannelLayerInterface::Status InMemoryChannelLayer::registerChannel(
    const std::string& channel, std::weak_ptr<ChannelReceiverInterface> receiver)
{
    if (channel.empty()) {
        return failure("registerChannel", channel, "Empty channel name");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = channels_.try_emplace(channel, receiver);
    if (!inserted) {
        if (!it->second.expired()) {
            return failure("registerChannel", channel, "Channel already registered");
        }
        it->second = receiver;
    }
    LOG_DEBUG(Transport, "Registered channel {}", channel);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::unregisterChannel(const std::string& channel)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (channels_.erase(channel) == 0) {
        return failure("unregisterChannel", channel, "Unknown channel");
    }

    for (auto it = groups_.begin(); it != groups_.end();) {
        it->second.erase(channel);
        if (it->second.empty()) {
            it = groups_.erase(it);
        }
        else {
            ++it;
        }
    }
    LOG_DEBUG(Transport, "Unregistered channel {}", channel);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::sendToConnection(
    const std::string& channel, const nlohmann::json& message)
{
    auto receiver = findReceiver(channel);
    if (!receiver) {
        return failure("sendToConnection", channel, "Unknown channel");
    }
    receiver->deliverMessage(message);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::joinGroup(
    const std::string& group, const std::string& channel)
{
    if (group.empty()) {
        return failure("joinGroup", channel, "Empty group name");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (channels_.count(channel) == 0) {
        return failure("joinGroup", channel, "Unknown channel");
    }
    groups_[group].insert(channel);
    LOG_DEBUG(Groups, "{} joined {}", channel, group);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::leaveGroup(
    const std::string& group, const std::string& channel)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group);
    if (it != groups_.end()) {
        it->second.erase(channel);
        if (it->second.empty()) {
            groups_.erase(it);
        }
    }
    LOG_DEBUG(Groups, "{} left {}", channel, group);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::sendToGroup(
    const std::string& group, const GroupEnvelope& envelope)
{
    const auto receivers = groupReceivers(group);
    LOG_DEBUG(Groups, "Group send to {} ({} members)", group, receivers.size());

    GroupEnvelope addressed = envelope;
    addressed.group = group;
    for (const auto& receiver : receivers) {
        receiver->deliverGroupMessage(addressed);
    }
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::sendEvent(
    const std::string& channel, const EventEnvelope& envelope)
{
    auto receiver = findReceiver(channel);
    if (!receiver) {
        return failure("sendEvent", channel, "Unknown channel");
    }

    EventEnvelope addressed = envelope;
    addressed.mode = EventDispatchMode::Unicast;
    addressed.target = channel;
    receiver->deliverEvent(addressed);
    return okay();
}

ChannelLayerInterface::Status InMemoryChannelLayer::broadcastEvent(
    const std::string& group, const EventEnvelope& envelope)
{
    const auto receivers = groupReceivers(group);
    LOG_DEBUG(Events, "Event broadcast to {} ({} members)", group, receivers.size());

    EventEnvelope addressed = envelope;
    addressed.mode = EventDispatchMode::Broadcast;
    addressed.target = group;
    for (const auto& receiver : receivers) {
        receiver->deliverEvent(addressed);
    }
    return okay();
}

std::vector<std::string> InMemoryChannelLayer::groupMembers(const std::string& group) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

bool InMemoryChannelLayer::hasChannel(const std::string& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    return it != channels_.end() && !it->second.expired();
}

size_t InMemoryChannelLayer::channelCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

std::shared_ptr<ChannelReceiverInterface> InMemoryChannelLayer::findReceiver(
    const std::string& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

std::vector<std::shared_ptr<ChannelReceiverInterface>> InMemoryChannelLayer::groupReceivers(
    const std::string& group) const
{
    std::vector<std::shared_ptr<ChannelReceiverInterface>> receivers;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = groups_.find(group);
    if (it == groups_.end()) {
        return receivers;
    }
    for (const auto& channel : it->second) {
        auto channelIt = channels_.find(channel);
        if (channelIt == channels_.end()) {
            continue;
        }
        if (auto receiver = channelIt->second.lock()) {
            receivers.push_back(std::move(receiver));
        }
    }
    return receivers;
}

} // namespace Switchboard
