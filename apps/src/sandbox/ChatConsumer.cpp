#include "ChatConsumer.h"
#include "api/ChatApi.h"
#include "core/LoggingChannels.h"
#include "dispatch/HandlerContext.h"
#include "dispatch/SchemaRegistry.h"
#include <stdexcept>

namespace Switchboard {
namespace Sandbox {

using namespace SandboxApi;

namespace {

std::vector<std::string> roomsOf(const Connection& connection)
{
    return { connection.groups().begin(), connection.groups().end() };
}

void requireRoomName(const std::string& room)
{
    if (room.empty()) {
        throw std::invalid_argument("Room name must not be empty");
    }
}

} // namespace

Result<std::shared_ptr<const Consumer>, ConstructionError> makeChatConsumer(
    const ConsumerConfig& config,
    std::shared_ptr<AuthenticatorInterface> authenticator,
    std::vector<std::string> defaultRooms)
{
    using ConsumerResult = Result<std::shared_ptr<const Consumer>, ConstructionError>;

    SchemaRegistry registry;

    registry.onMessage<Ping>(
        [](HandlerContext&, const Ping& ping) { return Pong{ ping.payload }; },
        { .summary = "Ping", .tags = { "health" } });

    registry.onMessage<Chat>(
        [](HandlerContext& context, const Chat& chat) {
            ChatPosted posted{ { chat.payload.text, context.identity(), chat.payload.room } };
            if (chat.payload.room.has_value()) {
                requireRoomName(chat.payload.room.value());
                context.broadcast(posted, std::vector<std::string>{ chat.payload.room.value() });
            }
            else {
                context.broadcast(posted);
            }
        },
        { .summary = "Post to rooms", .tags = { "chat" }, .outputs = { messageTypeOf<ChatPosted>() } });

    registry.onMessage<JoinRoom>(
        [](HandlerContext& context, const JoinRoom& join) {
            const std::string& room = join.payload.room;
            requireRoomName(room);
            context.joinGroup(room);
            return RoomChanged{ { room, true, roomsOf(context.connection()) } };
        },
        { .summary = "Join a room", .tags = { "rooms" } });

    registry.onMessage<LeaveRoom>(
        [](HandlerContext& context, const LeaveRoom& leave) {
            const std::string& room = leave.payload.room;
            requireRoomName(room);
            context.leaveGroup(room);
            return RoomChanged{ { room, false, roomsOf(context.connection()) } };
        },
        { .summary = "Leave a room", .tags = { "rooms" } });

    auto table = registry.build();
    if (table.isError()) {
        return ConsumerResult::error(table.errorValue());
    }

    auto consumer = std::make_shared<Consumer>("chat", config, table.value());
    consumer->setAuthenticator(std::move(authenticator));
    consumer->setGroupBuilder(
        [rooms = std::move(defaultRooms)](const Connection&) { return rooms; });
    consumer->setPostAuthentication([](HandlerContext& context) {
        context.send(Welcome{ { context.identity(), roomsOf(context.connection()) } });
    });

    LOG_INFO(Sandbox, "Chat consumer ready ({} handlers)", table.value()->size());
    return ConsumerResult::okay(std::move(consumer));
}

} // namespace Sandbox
} // namespace Switchboard
