#pragma once

#include "ChannelLayerInterface.h"
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace Switchboard {

/**
 * @brief Single-process channel layer.
 *
 * Keeps channel -> receiver and group -> members indexes behind one mutex.
 * Deliveries happen on the calling thread, outside the lock.
 */
class InMemoryChannelLayer : public ChannelLayerInterface {
public:
    Status registerChannel(
        const std::string& channel, std::weak_ptr<ChannelReceiverInterface> receiver) override;
    Status unregisterChannel(const std::string& channel) override;

    Status sendToConnection(const std::string& channel, const nlohmann::json& message) override;

    Status joinGroup(const std::string& group, const std::string& channel) override;
    Status leaveGroup(const std::string& group, const std::string& channel) override;
    Status sendToGroup(const std::string& group, const GroupEnvelope& envelope) override;

    Status sendEvent(const std::string& channel, const EventEnvelope& envelope) override;
    Status broadcastEvent(const std::string& group, const EventEnvelope& envelope) override;

    std::vector<std::string> groupMembers(const std::string& group) const;
    bool hasChannel(const std::string& channel) const;
    size_t channelCount() const;

private:
    std::shared_ptr<ChannelReceiverInterface> findReceiver(const std::string& channel) const;
    std::vector<std::shared_ptr<ChannelReceiverInterface>> groupReceivers(
        const std::string& group) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<ChannelReceiverInterface>> channels_;
    std::map<std::string, std::set<std::string>> groups_;
};

} // namespace Switchboard
