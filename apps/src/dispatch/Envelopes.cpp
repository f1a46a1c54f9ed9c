#include "Envelopes.h"

namespace Switchboard {

const char* toString(EventDispatchMode mode)
{
    switch (mode) {
        case EventDispatchMode::Unicast:
            return "unicast";
        case EventDispatchMode::Broadcast:
            return "broadcast";
    }
    return "unknown";
}

EventEnvelope EventEnvelope::unicast(std::string channel, nlohmann::json event)
{
    EventEnvelope envelope;
    envelope.event = std::move(event);
    envelope.mode = EventDispatchMode::Unicast;
    envelope.target = std::move(channel);
    return envelope;
}

EventEnvelope EventEnvelope::broadcast(std::string group, nlohmann::json event)
{
    EventEnvelope envelope;
    envelope.event = std::move(event);
    envelope.mode = EventDispatchMode::Broadcast;
    envelope.target = std::move(group);
    return envelope;
}

EventEnvelope& EventEnvelope::from(
    std::optional<std::string> channel, std::optional<std::string> identity)
{
    originChannel = std::move(channel);
    originIdentity = std::move(identity);
    return *this;
}

} // namespace Switchboard
