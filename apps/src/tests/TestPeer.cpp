#include "tests/TestPeer.h"
#include <stdexcept>

namespace Switchboard::Tests {

std::shared_ptr<TestPeer> TestPeer::create(
    const std::string& id,
    std::shared_ptr<const HandlerTable> handlers,
    std::shared_ptr<ChannelLayerInterface> channelLayer,
    std::shared_ptr<const ConsumerConfig> config,
    std::optional<std::string> identity)
{
    std::shared_ptr<TestPeer> peer(
        new TestPeer(id, std::move(handlers), std::move(channelLayer), std::move(config)));
    peer->connection_.setIdentity(std::move(identity));

    auto registered = peer->channelLayer_->registerChannel(id, peer->weak_from_this());
    if (registered.isError()) {
        throw std::runtime_error(registered.errorValue().toString());
    }
    peer->connection_.setState(ConnectionState::Open);
    return peer;
}

TestPeer::TestPeer(
    const std::string& id,
    std::shared_ptr<const HandlerTable> handlers,
    std::shared_ptr<ChannelLayerInterface> channelLayer,
    std::shared_ptr<const ConsumerConfig> config)
    : channelLayer_(std::move(channelLayer)),
      sink_(std::make_shared<FakeClientSink>()),
      connection_(id, sink_, config),
      dispatcher_(handlers, *channelLayer_, config),
      router_(handlers, *channelLayer_, config)
{}

TestPeer::~TestPeer()
{
    auto result = channelLayer_->unregisterChannel(connection_.id());
    (void)result;
}

void TestPeer::join(const std::string& group)
{
    auto result = dispatcher_.broadcaster().join(connection_, group);
    if (result.isError()) {
        throw std::runtime_error(result.errorValue().toString());
    }
}

Dispatcher::DispatchResult TestPeer::send(const nlohmann::json& message)
{
    return dispatcher_.dispatch(connection_, message);
}

Dispatcher::DispatchResult TestPeer::sendText(const std::string& text)
{
    return dispatcher_.dispatch(connection_, text);
}

void TestPeer::deliverMessage(const nlohmann::json& message)
{
    auto result = connection_.send(message);
    if (result.isError()) {
        throw std::runtime_error(result.errorValue().toString());
    }
}

void TestPeer::deliverGroupMessage(const GroupEnvelope& envelope)
{
    auto result = dispatcher_.broadcaster().deliver(connection_, envelope);
    if (result.isError()) {
        throw std::runtime_error(result.errorValue().toString());
    }
}

void TestPeer::deliverEvent(const EventEnvelope& envelope)
{
    auto result = router_.routeEvent(connection_, envelope);
    if (result.isError()) {
        throw std::runtime_error(result.errorValue().toString());
    }
    routeOutcomes_.push_back(result.value());
}

} // namespace Switchboard::Tests
