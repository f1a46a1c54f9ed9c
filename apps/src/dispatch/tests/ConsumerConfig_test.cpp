#include "dispatch/ConsumerConfig.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace Switchboard;

TEST(ConsumerConfigTest, DefaultsFromEmptyObject)
{
    const auto config = nlohmann::json::object().get<ConsumerConfig>();

    EXPECT_FALSE(config.completionSignalsEnabled);
    EXPECT_EQ(config.discriminatorField, "action");
    EXPECT_TRUE(config.ignoredDiscriminatorsForLogging.empty());
    EXPECT_FALSE(config.sendAuthenticationMessage);
    EXPECT_TRUE(config.logReceivedMessages);
    EXPECT_TRUE(config.logSentMessages);
    EXPECT_FALSE(config.reportEventRoutingErrors);
}

TEST(ConsumerConfigTest, ParsesEveryField)
{
    const auto config = nlohmann::json::parse(R"({
        "completionSignalsEnabled": true,
        "discriminatorField": "type",
        "ignoredDiscriminatorsForLogging": ["heartbeat", "ping"],
        "sendAuthenticationMessage": true,
        "logReceivedMessages": false,
        "logSentMessages": true,
        "reportEventRoutingErrors": true
    })")
                            .get<ConsumerConfig>();

    EXPECT_TRUE(config.completionSignalsEnabled);
    EXPECT_EQ(config.discriminatorField, "type");
    EXPECT_EQ(config.ignoredDiscriminatorsForLogging, (std::set<std::string>{ "heartbeat", "ping" }));
    EXPECT_TRUE(config.sendAuthenticationMessage);
    EXPECT_FALSE(config.logReceivedMessages);
    EXPECT_TRUE(config.reportEventRoutingErrors);
}

TEST(ConsumerConfigTest, EmptyDiscriminatorFieldIsRejected)
{
    EXPECT_THROW(
        nlohmann::json({ { "discriminatorField", "" } }).get<ConsumerConfig>(), std::invalid_argument);
}

TEST(ConsumerConfigTest, IgnoredDiscriminatorsAreNotLogged)
{
    ConsumerConfig config;
    config.ignoredDiscriminatorsForLogging = { "heartbeat" };

    EXPECT_FALSE(config.shouldLogReceived("heartbeat"));
    EXPECT_FALSE(config.shouldLogSent("heartbeat"));
    EXPECT_TRUE(config.shouldLogReceived("chat"));

    config.logSentMessages = false;
    EXPECT_FALSE(config.shouldLogSent("chat"));
    EXPECT_TRUE(config.shouldLogReceived("chat"));
}

TEST(ConsumerConfigTest, RoundTripsThroughJson)
{
    ConsumerConfig config;
    config.completionSignalsEnabled = true;
    config.discriminatorField = "kind";

    const nlohmann::json j = config;
    EXPECT_EQ(j["completionSignalsEnabled"], true);
    EXPECT_EQ(j["discriminatorField"], "kind");
    EXPECT_EQ(j.get<ConsumerConfig>().discriminatorField, "kind");
}
