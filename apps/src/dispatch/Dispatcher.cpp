#include "Dispatcher.h"
#include "HandlerContext.h"
#include "SystemMessages.h"
#include "WireFormat.h"
#include "core/LoggingChannels.h"

namespace Switchboard {

const char* toString(DispatchStatus status)
{
    switch (status) {
        case DispatchStatus::Handled:
            return "handled";
        case DispatchStatus::ValidationFailed:
            return "validation failed";
        case DispatchStatus::HandlerFailed:
            return "handler failed";
        case DispatchStatus::Dropped:
            return "dropped";
    }
    return "unknown";
}

Dispatcher::Dispatcher(
    std::shared_ptr<const HandlerTable> handlers,
    ChannelLayerInterface& channelLayer,
    std::shared_ptr<const ConsumerConfig> config)
    : handlers_(std::move(handlers)),
      channelLayer_(channelLayer),
      config_(config ? std::move(config) : std::make_shared<const ConsumerConfig>()),
      broadcaster_(channelLayer, config_)
{}

Dispatcher::DispatchResult Dispatcher::dispatch(Connection& connection, const std::string& rawText)
{
    if (!connection.isOpen()) {
        LOG_WARN(
            Dispatch,
            "Dropping message for {} in state {}",
            connection.id(),
            toString(connection.state()));
        return DispatchResult::okay(DispatchOutcome{});
    }

    auto parsed = WireFormat::parseText(rawText);
    if (parsed.isError()) {
        if (config_->logReceivedMessages) {
            LOG_INFO(Dispatch, "{} -> (invalid JSON) {}", connection.id(), rawText);
        }
        DispatchOutcome outcome;
        outcome.status = DispatchStatus::ValidationFailed;
        outcome.issues.push_back(parsed.errorValue());
        return reject(connection, std::move(outcome));
    }

    return dispatch(connection, parsed.value());
}

Dispatcher::DispatchResult Dispatcher::dispatch(Connection& connection, const nlohmann::json& message)
{
    if (!connection.isOpen()) {
        LOG_WARN(
            Dispatch,
            "Dropping message for {} in state {}",
            connection.id(),
            toString(connection.state()));
        return DispatchResult::okay(DispatchOutcome{});
    }

    connection.touch();

    const std::string& field = config_->discriminatorField;
    const std::string tag = WireFormat::logLabel(message, field);
    if (config_->shouldLogReceived(tag)) {
        LOG_INFO(Dispatch, "{} -> {}", connection.id(), WireFormat::serialize(message));
    }

    DispatchOutcome outcome;
    outcome.discriminator = tag;

    auto validated = handlers_->clientUnion().validate(message, field);
    if (validated.isError()) {
        outcome.status = DispatchStatus::ValidationFailed;
        outcome.issues = std::move(validated.errorValue());
        LOG_DEBUG(
            Dispatch,
            "Rejected '{}' from {}: {}",
            tag,
            connection.id(),
            describeIssues(outcome.issues));
        return reject(connection, std::move(outcome));
    }

    const std::string& discriminator = validated.value()->discriminator;
    const HandlerBinding* binding = handlers_->find(Direction::Client, discriminator);
    if (!binding) {
        LOG_ERROR(Dispatch, "No client binding for validated discriminator '{}'", discriminator);
        outcome.status = DispatchStatus::ValidationFailed;
        outcome.issues.push_back(ValidationIssue{
            IssueType::UnknownDiscriminator,
            nlohmann::json::array({ field }),
            "No handler for '" + discriminator + "'" });
        return reject(connection, std::move(outcome));
    }

    HandlerContext context(connection, channelLayer_, broadcaster_);
    std::optional<nlohmann::json> output;
    try {
        output = binding->invoker(context, message);
        outcome.status = DispatchStatus::Handled;
    }
    catch (const TransportException& e) {
        LOG_ERROR(
            Dispatch,
            "Transport failure in {} for {}: {}",
            binding->metadata.name,
            connection.id(),
            e.what());
        return DispatchResult::error(e.error());
    }
    catch (const std::exception& e) {
        LOG_ERROR(
            Dispatch,
            "Failed to process message '{}' from {}: {}",
            discriminator,
            connection.id(),
            e.what());
        outcome.status = DispatchStatus::HandlerFailed;
    }
    catch (...) {
        LOG_ERROR(
            Dispatch,
            "Failed to process message '{}' from {}: unknown exception",
            discriminator,
            connection.id());
        outcome.status = DispatchStatus::HandlerFailed;
    }
    outcome.broadcasts = context.broadcastCount();

    if (outcome.status == DispatchStatus::HandlerFailed) {
        auto sent = connection.send(SystemMessages::handlerError(field));
        if (sent.isError()) {
            return DispatchResult::error(sent.errorValue());
        }
    }
    else if (output.has_value()) {
        auto sent = connection.send(output.value());
        if (sent.isError()) {
            return DispatchResult::error(sent.errorValue());
        }
        outcome.replied = true;
    }

    return finish(connection, std::move(outcome));
}

Dispatcher::DispatchResult Dispatcher::reject(Connection& connection, DispatchOutcome outcome)
{
    auto sent = connection.send(SystemMessages::error(config_->discriminatorField, outcome.issues));
    if (sent.isError()) {
        return DispatchResult::error(sent.errorValue());
    }
    return finish(connection, std::move(outcome));
}

Dispatcher::DispatchResult Dispatcher::finish(Connection& connection, DispatchOutcome outcome)
{
    if (config_->completionSignalsEnabled) {
        auto sent = connection.send(SystemMessages::complete(config_->discriminatorField));
        if (sent.isError()) {
            return DispatchResult::error(sent.errorValue());
        }
        if (outcome.broadcasts > 0) {
            sent = connection.send(SystemMessages::groupComplete(config_->discriminatorField));
            if (sent.isError()) {
                return DispatchResult::error(sent.errorValue());
            }
        }
    }
    return DispatchResult::okay(std::move(outcome));
}

} // namespace Switchboard
