#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief A broadcast message in flight to the members of one group.
 */
struct GroupEnvelope {
    std::string group;
    nlohmann::json content;
    std::string originChannel;
    std::optional<std::string> originIdentity;
    bool excludeOrigin = false;
};

enum class EventDispatchMode { Unicast, Broadcast };

const char* toString(EventDispatchMode mode);

/**
 * @brief An event injected from outside the client socket.
 *
 * The origin is optional: events raised by background jobs usually carry none,
 * in which case group enrichment sees a null identity.
 */
struct EventEnvelope {
    nlohmann::json event;
    EventDispatchMode mode = EventDispatchMode::Unicast;
    // Target channel for unicast events, target group for broadcast events.
    std::string target;
    std::optional<std::string> originChannel;
    std::optional<std::string> originIdentity;

    static EventEnvelope unicast(std::string channel, nlohmann::json event);
    static EventEnvelope broadcast(std::string group, nlohmann::json event);

    EventEnvelope& from(std::optional<std::string> channel, std::optional<std::string> identity);
};

} // namespace Switchboard
