#pragma once

#include "dispatch/MessageTraits.h"
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {
namespace SandboxApi {

struct PingPayload {
    std::optional<int> seq;
};

struct Ping {
    SWITCHBOARD_ACTION("ping");
    SWITCHBOARD_DESCRIPTION("Liveness check, answered with pong");
    std::optional<PingPayload> payload;
};

struct Pong {
    SWITCHBOARD_ACTION("pong");
    std::optional<PingPayload> payload;
};

struct ChatText {
    std::string text;
    // Restricts the broadcast to one room; all joined rooms otherwise.
    std::optional<std::string> room;
};

struct Chat {
    SWITCHBOARD_ACTION("chat");
    SWITCHBOARD_DESCRIPTION("Post a line to your rooms");
    ChatText payload;
};

struct ChatLine {
    std::string text;
    std::optional<std::string> author;
    std::optional<std::string> room;
};

struct ChatPosted {
    SWITCHBOARD_ACTION("chat_posted");
    ChatLine payload;
};

struct RoomName {
    std::string room;
};

struct JoinRoom {
    SWITCHBOARD_ACTION("join_room");
    RoomName payload;
};

struct LeaveRoom {
    SWITCHBOARD_ACTION("leave_room");
    RoomName payload;
};

struct RoomMembership {
    std::string room;
    bool joined = false;
    std::vector<std::string> rooms;
};

struct RoomChanged {
    SWITCHBOARD_ACTION("room_changed");
    RoomMembership payload;
};

struct WelcomeInfo {
    std::optional<std::string> identity;
    std::vector<std::string> rooms;
};

struct Welcome {
    SWITCHBOARD_ACTION("welcome");
    WelcomeInfo payload;
};

} // namespace SandboxApi
} // namespace Switchboard
