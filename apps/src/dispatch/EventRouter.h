#pragma once

#include "ChannelLayerInterface.h"
#include "Connection.h"
#include "ConsumerConfig.h"
#include "Envelopes.h"
#include "Errors.h"
#include "GroupBroadcaster.h"
#include "HandlerTable.h"
#include "ValidationIssue.h"
#include "core/Result.h"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

enum class RouteStatus { Handled, RoutingFailed, HandlerFailed, Dropped };

const char* toString(RouteStatus status);

struct RouteOutcome {
    RouteStatus status = RouteStatus::Dropped;
    std::string discriminator;
    // The handler's return value was sent to this connection.
    bool delivered = false;
    std::vector<ValidationIssue> issues;
};

/**
 * @brief Routes events delivered by the channel layer to event handlers.
 *
 * A handler result is sent to this connection. For a broadcast event it is
 * first enriched against the event's origin; the event itself already reached
 * every group member, so each member sends its own enriched copy.
 * Routing failures are logged and never answered, except for unicast events
 * when reportEventRoutingErrors is set.
 */
class EventRouter {
public:
    using RouteResult = Result<RouteOutcome, TransportError>;

    EventRouter(
        std::shared_ptr<const HandlerTable> handlers,
        ChannelLayerInterface& channelLayer,
        std::shared_ptr<const ConsumerConfig> config);

    RouteResult routeEvent(Connection& connection, const EventEnvelope& envelope);

private:
    RouteResult reportFailure(
        Connection& connection, const EventEnvelope& envelope, RouteOutcome outcome);

    std::shared_ptr<const HandlerTable> handlers_;
    ChannelLayerInterface& channelLayer_;
    std::shared_ptr<const ConsumerConfig> config_;
    GroupBroadcaster broadcaster_;
};

} // namespace Switchboard
