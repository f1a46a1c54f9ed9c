#include "EventRouter.h"
#include "HandlerContext.h"
#include "SystemMessages.h"
#include "WireFormat.h"
#include "core/LoggingChannels.h"

namespace Switchboard {

const char* toString(RouteStatus status)
{
    switch (status) {
        case RouteStatus::Handled:
            return "handled";
        case RouteStatus::RoutingFailed:
            return "routing failed";
        case RouteStatus::HandlerFailed:
            return "handler failed";
        case RouteStatus::Dropped:
            return "dropped";
    }
    return "unknown";
}

EventRouter::EventRouter(
    std::shared_ptr<const HandlerTable> handlers,
    ChannelLayerInterface& channelLayer,
    std::shared_ptr<const ConsumerConfig> config)
    : handlers_(std::move(handlers)),
      channelLayer_(channelLayer),
      config_(config ? std::move(config) : std::make_shared<const ConsumerConfig>()),
      broadcaster_(channelLayer, config_)
{}

EventRouter::RouteResult EventRouter::routeEvent(Connection& connection, const EventEnvelope& envelope)
{
    const std::string& field = config_->discriminatorField;
    const std::string tag = WireFormat::logLabel(envelope.event, field);

    if (!connection.isOpen()) {
        LOG_WARN(
            Events,
            "Dropping {} event '{}' for {} in state {}",
            toString(envelope.mode),
            tag,
            connection.id(),
            toString(connection.state()));
        return RouteResult::okay(RouteOutcome{});
    }

    if (config_->shouldLogReceived(tag)) {
        LOG_INFO(
            Events,
            "{} event for {}: {}",
            toString(envelope.mode),
            connection.id(),
            WireFormat::serialize(envelope.event));
    }

    RouteOutcome outcome;
    outcome.discriminator = tag;

    auto validated = handlers_->eventUnion().validate(envelope.event, field);
    if (validated.isError()) {
        outcome.status = RouteStatus::RoutingFailed;
        outcome.issues = std::move(validated.errorValue());
        LOG_WARN(
            Events,
            "Cannot route event '{}' for {}: {}",
            tag,
            connection.id(),
            describeIssues(outcome.issues));
        return reportFailure(connection, envelope, std::move(outcome));
    }

    const std::string& discriminator = validated.value()->discriminator;
    const HandlerBinding* binding = handlers_->find(Direction::Event, discriminator);
    if (!binding) {
        outcome.status = RouteStatus::RoutingFailed;
        outcome.issues.push_back(ValidationIssue{
            IssueType::RoutingError,
            nlohmann::json::array({ field }),
            "No event handler for '" + discriminator + "'" });
        LOG_ERROR(Events, "No event binding for validated discriminator '{}'", discriminator);
        return reportFailure(connection, envelope, std::move(outcome));
    }

    HandlerContext context(connection, channelLayer_, broadcaster_, &envelope);
    std::optional<nlohmann::json> output;
    try {
        output = binding->invoker(context, envelope.event);
    }
    catch (const TransportException& e) {
        LOG_ERROR(
            Events,
            "Transport failure in {} for {}: {}",
            binding->metadata.name,
            connection.id(),
            e.what());
        return RouteResult::error(e.error());
    }
    catch (const std::exception& e) {
        LOG_ERROR(
            Events,
            "Event handler {} failed for {}: {}",
            binding->metadata.name,
            connection.id(),
            e.what());
        outcome.status = RouteStatus::HandlerFailed;
        outcome.issues.push_back(ValidationIssue{
            IssueType::HandlerError, nlohmann::json::array(), SystemMessages::kHandlerFailureText });
        return reportFailure(connection, envelope, std::move(outcome));
    }
    catch (...) {
        LOG_ERROR(
            Events,
            "Event handler {} failed for {}: unknown exception",
            binding->metadata.name,
            connection.id());
        outcome.status = RouteStatus::HandlerFailed;
        outcome.issues.push_back(ValidationIssue{
            IssueType::HandlerError, nlohmann::json::array(), SystemMessages::kHandlerFailureText });
        return reportFailure(connection, envelope, std::move(outcome));
    }

    outcome.status = RouteStatus::Handled;

    if (output.has_value()) {
        nlohmann::json message = std::move(output.value());
        if (envelope.mode == EventDispatchMode::Broadcast) {
            const bool isCurrent =
                envelope.originChannel.has_value() && envelope.originChannel.value() == connection.id();
            const bool isMine =
                GroupBroadcaster::isMine(connection.identity(), envelope.originIdentity);
            message = GroupBroadcaster::enrich(message, isMine, isCurrent);
        }

        auto sent = connection.send(message);
        if (sent.isError()) {
            return RouteResult::error(sent.errorValue());
        }
        outcome.delivered = true;
    }

    if (config_->completionSignalsEnabled) {
        const bool broadcastEvent = envelope.mode == EventDispatchMode::Broadcast;
        if (!broadcastEvent) {
            auto sent = connection.send(SystemMessages::complete(field));
            if (sent.isError()) {
                return RouteResult::error(sent.errorValue());
            }
        }
        if (broadcastEvent || context.broadcastCount() > 0) {
            auto sent = connection.send(SystemMessages::groupComplete(field));
            if (sent.isError()) {
                return RouteResult::error(sent.errorValue());
            }
        }
    }

    return RouteResult::okay(std::move(outcome));
}

EventRouter::RouteResult EventRouter::reportFailure(
    Connection& connection, const EventEnvelope& envelope, RouteOutcome outcome)
{
    if (envelope.mode == EventDispatchMode::Unicast && config_->reportEventRoutingErrors) {
        auto sent = connection.send(SystemMessages::error(config_->discriminatorField, outcome.issues));
        if (sent.isError()) {
            return RouteResult::error(sent.errorValue());
        }
    }
    return RouteResult::okay(std::move(outcome));
}

} // namespace Switchboard
