#include "dispatch/ConnectionTask.h"
#include "dispatch/HandlerContext.h"
#include "dispatch/InMemoryChannelLayer.h"
#include "dispatch/SchemaRegistry.h"
#include "tests/FakeClientSink.h"
#include "tests/TestMessages.h"
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Switchboard;
using namespace Switchboard::Tests;
using namespace std::chrono_literals;

namespace {

// Accepts ?token=<name> as identity "<name>", refuses everything else.
class NameTokenAuthenticator : public AuthenticatorInterface {
public:
    Result<Authenticated, AuthenticationFailure> authenticate(const ConnectionRequest& request) override
    {
        auto token = request.queryValue("token");
        if (!token.has_value() || token->empty()) {
            return Result<Authenticated, AuthenticationFailure>::error(
                AuthenticationFailure{ 401, "Unauthorized" });
        }
        return Result<Authenticated, AuthenticationFailure>::okay(Authenticated{ token });
    }
};

std::shared_ptr<const HandlerTable> buildTable()
{
    SchemaRegistry registry;
    registry.onMessage<PingMessage>(
        [](HandlerContext&, const PingMessage& ping) { return PongMessage{ ping.seq }; });
    registry.onMessage<ChatMessage>([](HandlerContext& context, const ChatMessage& chat) {
        context.broadcastEvent("room_1", RoomNotice{ chat.payload.text });
    });
    registry.onEvent<RoomNotice>(
        [](HandlerContext&, const RoomNotice& notice) { return NoticeReceived{ notice.text }; });

    auto result = registry.build();
    if (result.isError()) {
        throw std::runtime_error(result.errorValue().message);
    }
    return result.value();
}

} // namespace

class ConnectionTaskTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        layer_ = std::make_shared<InMemoryChannelLayer>();
        config_.completionSignalsEnabled = true;
    }

    std::shared_ptr<Consumer> makeConsumer()
    {
        auto consumer = std::make_shared<Consumer>("chat", config_, buildTable());
        consumer->setAuthenticator(std::make_shared<NameTokenAuthenticator>());
        consumer->setGroupBuilder(
            [](const Connection&) { return std::vector<std::string>{ "room_1" }; });
        return consumer;
    }

    std::shared_ptr<ConnectionTask> startTask(
        std::shared_ptr<Consumer> consumer, std::shared_ptr<FakeClientSink> sink, const std::string& token)
    {
        auto task = ConnectionTask::create(
            consumer, layer_, sink, ConnectionRequest::fromTarget("/ws/chat?token=" + token));
        auto started = task->start();
        EXPECT_TRUE(started.isValue());
        return task;
    }

    std::shared_ptr<InMemoryChannelLayer> layer_;
    ConsumerConfig config_;
};

TEST_F(ConnectionTaskTest, StartOpensRegistersAndJoinsInitialGroups)
{
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");

    EXPECT_EQ(task->state(), ConnectionState::Open);
    EXPECT_EQ(task->identity(), "alice");
    EXPECT_TRUE(layer_->hasChannel(task->id()));
    EXPECT_EQ(layer_->groupMembers("room_1"), (std::vector<std::string>{ task->id() }));
}

TEST_F(ConnectionTaskTest, PingRoundTrip)
{
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");

    task->receiveText(R"({"action": "ping"})");
    ASSERT_TRUE(sink->waitForMessages(2));
    ASSERT_TRUE(task->waitIdle(2s));
    EXPECT_EQ(sink->discriminators(), (std::vector<std::string>{ "pong", "complete" }));
}

TEST_F(ConnectionTaskTest, ClientMessagesAreProcessedInOrder)
{
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");

    constexpr int kCount = 25;
    for (int i = 0; i < kCount; ++i) {
        task->receiveText(nlohmann::json{ { "action", "ping" }, { "seq", i } }.dump());
    }
    ASSERT_TRUE(sink->waitForMessages(2 * kCount));
    ASSERT_TRUE(task->waitIdle(2s));

    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), static_cast<size_t>(2 * kCount));
    for (int i = 0; i < kCount; ++i) {
        EXPECT_EQ(messages[2 * i]["action"], "pong");
        EXPECT_EQ(messages[2 * i]["seq"], i);
        EXPECT_EQ(messages[2 * i + 1]["action"], "complete");
    }
}

TEST_F(ConnectionTaskTest, BroadcastEventReachesEveryMemberWithOriginFlags)
{
    auto consumer = makeConsumer();
    auto aliceSink = std::make_shared<FakeClientSink>();
    auto bobSink = std::make_shared<FakeClientSink>();
    auto alice = startTask(consumer, aliceSink, "alice");
    auto bob = startTask(consumer, bobSink, "bob");

    alice->receiveText(R"({"action": "chat", "payload": {"text": "deploy finished"}})");
    ASSERT_TRUE(aliceSink->waitForMessages(3));
    ASSERT_TRUE(bobSink->waitForMessages(2));
    ASSERT_TRUE(alice->waitIdle(2s));
    ASSERT_TRUE(bob->waitIdle(2s));

    auto aliceMessages = aliceSink->messages();
    ASSERT_EQ(aliceMessages.size(), 3u);
    EXPECT_EQ(aliceMessages[0]["action"], "complete");
    EXPECT_EQ(aliceMessages[1]["action"], "notice");
    EXPECT_EQ(aliceMessages[1]["text"], "deploy finished");
    EXPECT_EQ(aliceMessages[1]["isMine"], true);
    EXPECT_EQ(aliceMessages[1]["isCurrent"], true);
    EXPECT_EQ(aliceMessages[2]["action"], "group_complete");

    auto bobMessages = bobSink->messages();
    ASSERT_EQ(bobMessages.size(), 2u);
    EXPECT_EQ(bobMessages[0]["action"], "notice");
    EXPECT_EQ(bobMessages[0]["isMine"], false);
    EXPECT_EQ(bobMessages[0]["isCurrent"], false);
    EXPECT_EQ(bobMessages[1]["action"], "group_complete");
}

TEST_F(ConnectionTaskTest, AuthenticationFailureClosesWith4003)
{
    config_.sendAuthenticationMessage = true;
    auto sink = std::make_shared<FakeClientSink>();
    auto task = ConnectionTask::create(
        makeConsumer(), layer_, sink, ConnectionRequest::fromTarget("/ws/chat"));

    auto started = task->start();
    ASSERT_TRUE(started.isError());
    EXPECT_EQ(task->state(), ConnectionState::Closed);
    EXPECT_EQ(sink->closeCode(), 4003);
    EXPECT_FALSE(layer_->hasChannel(task->id()));

    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["action"], "authentication");
    EXPECT_EQ(messages[0]["payload"]["status_code"], 401);
}

TEST_F(ConnectionTaskTest, AuthenticationMessageOnSuccessWhenConfigured)
{
    config_.sendAuthenticationMessage = true;
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");

    auto messages = sink->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0]["action"], "authentication");
    EXPECT_EQ(messages[0]["payload"]["status_code"], 200);
}

TEST_F(ConnectionTaskTest, PostAuthenticationHookRunsBeforeClientMessages)
{
    auto consumer = makeConsumer();
    consumer->setPostAuthentication([](HandlerContext& context) {
        context.sendJson({ { "action", "welcome" }, { "identity", context.identity().value_or("") } });
    });
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(consumer, sink, "alice");

    task->receiveText(R"({"action": "ping"})");
    ASSERT_TRUE(sink->waitForMessages(3));

    auto messages = sink->messages();
    EXPECT_EQ(messages[0]["action"], "welcome");
    EXPECT_EQ(messages[0]["identity"], "alice");
    EXPECT_EQ(messages[1]["action"], "pong");
}

TEST_F(ConnectionTaskTest, CloseLeavesGroupsAndUnregisters)
{
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");
    const std::string id = task->id();

    task->close();

    EXPECT_EQ(task->state(), ConnectionState::Closed);
    EXPECT_FALSE(layer_->hasChannel(id));
    EXPECT_TRUE(layer_->groupMembers("room_1").empty());
    EXPECT_EQ(sink->closeCode(), 1000);

    task->receiveText(R"({"action": "ping"})");
    EXPECT_TRUE(task->waitIdle(100ms));
    EXPECT_TRUE(sink->messages().empty());

    task->close();
}

TEST_F(ConnectionTaskTest, DirectMessagesAreForwarded)
{
    auto sink = std::make_shared<FakeClientSink>();
    auto task = startTask(makeConsumer(), sink, "alice");

    ASSERT_TRUE(layer_->sendToConnection(task->id(), { { "action", "maintenance" } }).isValue());
    ASSERT_TRUE(sink->waitForMessages(1));
    EXPECT_EQ(sink->discriminators(), (std::vector<std::string>{ "maintenance" }));
}
