#include "core/StringCase.h"
#include <gtest/gtest.h>

using namespace Switchboard;

TEST(StringCaseTest, CamelCaseBecomesSnakeCase)
{
    EXPECT_EQ(toSnakeCase("ChatMessage"), "chat_message");
    EXPECT_EQ(toSnakeCase("getServerStatus"), "get_server_status");
    EXPECT_EQ(toSnakeCase("ping"), "ping");
}

TEST(StringCaseTest, AcronymsStayTogether)
{
    EXPECT_EQ(toSnakeCase("HTTPRequest"), "http_request");
    EXPECT_EQ(toSnakeCase("JobID"), "job_id");
    EXPECT_EQ(toSnakeCase("Room2Notice"), "room2_notice");
}

TEST(StringCaseTest, NamespaceQualifiersAreDropped)
{
    EXPECT_EQ(toSnakeCase("Switchboard::Sandbox::SubmitJob"), "submit_job");
}

TEST(StringCaseTest, SeparatorsBecomeUnderscores)
{
    EXPECT_EQ(toSnakeCase("list-rooms"), "list_rooms");
    EXPECT_EQ(toSnakeCase("List Rooms"), "list_rooms");
    EXPECT_EQ(toSnakeCase(""), "");
}
