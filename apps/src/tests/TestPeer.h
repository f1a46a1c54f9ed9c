#pragma once

#include "dispatch/ChannelLayerInterface.h"
#include "dispatch/Connection.h"
#include "dispatch/Dispatcher.h"
#include "dispatch/EventRouter.h"
#include "tests/FakeClientSink.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard::Tests {

/**
 * @brief A connection wired straight to a channel layer, without a task queue.
 *
 * Channel-layer deliveries are handled synchronously on the calling thread,
 * which keeps single-threaded dispatch tests deterministic.
 */
class TestPeer : public ChannelReceiverInterface, public std::enable_shared_from_this<TestPeer> {
public:
    static std::shared_ptr<TestPeer> create(
        const std::string& id,
        std::shared_ptr<const HandlerTable> handlers,
        std::shared_ptr<ChannelLayerInterface> channelLayer,
        std::shared_ptr<const ConsumerConfig> config,
        std::optional<std::string> identity = std::nullopt);

    ~TestPeer() override;

    Connection& connection() { return connection_; }
    FakeClientSink& sink() { return *sink_; }
    Dispatcher& dispatcher() { return dispatcher_; }

    void join(const std::string& group);

    Dispatcher::DispatchResult send(const nlohmann::json& message);
    Dispatcher::DispatchResult sendText(const std::string& text);

    const std::vector<RouteOutcome>& routeOutcomes() const { return routeOutcomes_; }

    void deliverMessage(const nlohmann::json& message) override;
    void deliverGroupMessage(const GroupEnvelope& envelope) override;
    void deliverEvent(const EventEnvelope& envelope) override;

private:
    TestPeer(
        const std::string& id,
        std::shared_ptr<const HandlerTable> handlers,
        std::shared_ptr<ChannelLayerInterface> channelLayer,
        std::shared_ptr<const ConsumerConfig> config);

    std::shared_ptr<ChannelLayerInterface> channelLayer_;
    std::shared_ptr<FakeClientSink> sink_;
    Connection connection_;
    Dispatcher dispatcher_;
    EventRouter router_;
    std::vector<RouteOutcome> routeOutcomes_;
};

} // namespace Switchboard::Tests
