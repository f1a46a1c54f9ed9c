#include "dispatch/GroupBroadcaster.h"
#include "dispatch/InMemoryChannelLayer.h"
#include "dispatch/SchemaRegistry.h"
#include "tests/RecordingChannelLayer.h"
#include "tests/TestPeer.h"
#include <gtest/gtest.h>

using namespace Switchboard;
using namespace Switchboard::Tests;

class GroupBroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto table = SchemaRegistry().build();
        ASSERT_TRUE(table.isValue());
        handlers_ = table.value();
        layer_ = std::make_shared<RecordingChannelLayer>(std::make_shared<InMemoryChannelLayer>());
        config_ = std::make_shared<ConsumerConfig>();
    }

    std::shared_ptr<TestPeer> makePeer(
        const std::string& id, std::optional<std::string> identity = std::nullopt)
    {
        return TestPeer::create(id, handlers_, layer_, config_, std::move(identity));
    }

    GroupBroadcaster::FanOut broadcast(
        TestPeer& origin,
        const nlohmann::json& message,
        std::optional<std::vector<std::string>> groups = std::nullopt,
        bool excludeOrigin = false)
    {
        return origin.dispatcher().broadcaster().broadcast(
            origin.connection(), message, std::move(groups), excludeOrigin);
    }

    const nlohmann::json news_ = { { "action", "news" }, { "headline", "rain" } };
    std::shared_ptr<const HandlerTable> handlers_;
    std::shared_ptr<RecordingChannelLayer> layer_;
    std::shared_ptr<ConsumerConfig> config_;
};

TEST_F(GroupBroadcasterTest, EnrichAddsFlags)
{
    auto enriched = GroupBroadcaster::enrich(news_, true, false);
    EXPECT_EQ(enriched["headline"], "rain");
    EXPECT_EQ(enriched["isMine"], true);
    EXPECT_EQ(enriched["isCurrent"], false);
}

TEST_F(GroupBroadcasterTest, EnrichWrapsNonObjectContent)
{
    auto enriched = GroupBroadcaster::enrich(nlohmann::json::array({ 1, 2 }), false, false);
    EXPECT_EQ(enriched["payload"], nlohmann::json::array({ 1, 2 }));
    EXPECT_EQ(enriched["isMine"], false);
}

TEST_F(GroupBroadcasterTest, IsMineNeedsBothIdentities)
{
    EXPECT_TRUE(GroupBroadcaster::isMine(std::string("alice"), std::string("alice")));
    EXPECT_FALSE(GroupBroadcaster::isMine(std::string("alice"), std::string("bob")));
    EXPECT_FALSE(GroupBroadcaster::isMine(std::nullopt, std::string("alice")));
    EXPECT_FALSE(GroupBroadcaster::isMine(std::string("alice"), std::nullopt));
    EXPECT_FALSE(GroupBroadcaster::isMine(std::nullopt, std::nullopt));
}

TEST_F(GroupBroadcasterTest, JoinAndLeaveTrackMembership)
{
    auto alice = makePeer("a");
    auto& broadcaster = alice->dispatcher().broadcaster();

    ASSERT_TRUE(broadcaster.join(alice->connection(), "room_1").isValue());
    ASSERT_TRUE(broadcaster.join(alice->connection(), "room_2").isValue());
    EXPECT_EQ(alice->connection().groups(), (std::set<std::string>{ "room_1", "room_2" }));

    ASSERT_TRUE(broadcaster.leave(alice->connection(), "room_1").isValue());
    EXPECT_EQ(alice->connection().groups(), (std::set<std::string>{ "room_2" }));

    ASSERT_TRUE(broadcaster.leaveAll(alice->connection()).isValue());
    EXPECT_TRUE(alice->connection().groups().empty());
}

TEST_F(GroupBroadcasterTest, DefaultTargetsAreOriginMemberships)
{
    auto alice = makePeer("a");
    auto bob = makePeer("b");
    auto carol = makePeer("c");
    alice->join("room_1");
    alice->join("room_2");
    bob->join("room_2");
    carol->join("room_3");

    ASSERT_TRUE(broadcast(*alice, news_).isValue());

    EXPECT_EQ(layer_->groupSends().size(), 2u);
    EXPECT_EQ(bob->sink().messages().size(), 1u);
    EXPECT_TRUE(carol->sink().messages().empty());
    EXPECT_EQ(alice->sink().messages().size(), 1u);
}

TEST_F(GroupBroadcasterTest, OneGroupSendPerTargetGroup)
{
    auto alice = makePeer("a");
    auto bob = makePeer("b");
    bob->join("room_1");
    bob->join("room_2");

    auto result = broadcast(*alice, news_, std::vector<std::string>{ "room_1", "room_2" });
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), 2u);

    auto sends = layer_->groupSends();
    ASSERT_EQ(sends.size(), 2u);
    EXPECT_EQ(sends[0].group, "room_1");
    EXPECT_EQ(sends[1].group, "room_2");
    EXPECT_EQ(sends[0].originChannel, "a");
}

TEST_F(GroupBroadcasterTest, OriginOutsideTargetGroupsGetsNoCopy)
{
    auto alice = makePeer("a");
    auto bob = makePeer("b");
    bob->join("room_1");

    ASSERT_TRUE(broadcast(*alice, news_, std::vector<std::string>{ "room_1" }).isValue());

    EXPECT_TRUE(alice->sink().messages().empty());
    EXPECT_EQ(bob->sink().messages().size(), 1u);
}

TEST_F(GroupBroadcasterTest, ExcludeOriginSkipsOriginOnly)
{
    auto alice = makePeer("a");
    auto bob = makePeer("b");
    alice->join("room_1");
    bob->join("room_1");

    ASSERT_TRUE(broadcast(*alice, news_, std::nullopt, true).isValue());

    EXPECT_TRUE(alice->sink().messages().empty());
    ASSERT_EQ(bob->sink().messages().size(), 1u);
    EXPECT_EQ(bob->sink().messages()[0]["headline"], "rain");
}

TEST_F(GroupBroadcasterTest, NoTargetsSendsNothing)
{
    auto alice = makePeer("a");

    auto result = broadcast(*alice, news_);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_TRUE(layer_->groupSends().empty());
    EXPECT_TRUE(alice->sink().messages().empty());
}

TEST_F(GroupBroadcasterTest, RecipientGetsGroupCompleteWhenEnabled)
{
    config_->completionSignalsEnabled = true;
    auto alice = makePeer("a", "alice");
    auto bob = makePeer("b", "bob");
    alice->join("room_1");
    bob->join("room_1");

    ASSERT_TRUE(broadcast(*alice, news_).isValue());

    EXPECT_EQ(bob->sink().discriminators(), (std::vector<std::string>{ "news", "group_complete" }));
    EXPECT_EQ(alice->sink().discriminators(), (std::vector<std::string>{ "news" }));
}

TEST_F(GroupBroadcasterTest, DeliverSkipsTheOriginChannel)
{
    auto alice = makePeer("a");
    GroupEnvelope envelope{ "room_1", news_, "a", std::nullopt, false };

    ASSERT_TRUE(
        alice->dispatcher().broadcaster().deliver(alice->connection(), envelope).isValue());
    EXPECT_TRUE(alice->sink().messages().empty());
}
