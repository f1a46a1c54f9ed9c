#pragma once

#include "ChannelLayerInterface.h"
#include "Connection.h"
#include "ConsumerConfig.h"
#include "Errors.h"
#include "GroupBroadcaster.h"
#include "HandlerTable.h"
#include "ValidationIssue.h"
#include "core/Result.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Switchboard {

enum class DispatchStatus { Handled, ValidationFailed, HandlerFailed, Dropped };

const char* toString(DispatchStatus status);

struct DispatchOutcome {
    DispatchStatus status = DispatchStatus::Dropped;
    std::string discriminator;
    // The handler's return value was unicast back to the client.
    bool replied = false;
    size_t broadcasts = 0;
    std::vector<ValidationIssue> issues;
};

/**
 * @brief Validates, routes and invokes client messages for one consumer.
 *
 * After a message is handled the Dispatcher, when completion signals are
 * enabled, sends exactly one "complete" and, if the handler broadcast, one
 * "group_complete" after it. Validation failures and handler exceptions are
 * answered with an error message and the connection stays open. Transport
 * failures are returned to the caller.
 */
class Dispatcher {
public:
    using DispatchResult = Result<DispatchOutcome, TransportError>;

    Dispatcher(
        std::shared_ptr<const HandlerTable> handlers,
        ChannelLayerInterface& channelLayer,
        std::shared_ptr<const ConsumerConfig> config);

    DispatchResult dispatch(Connection& connection, const std::string& rawText);
    DispatchResult dispatch(Connection& connection, const nlohmann::json& message);

    GroupBroadcaster& broadcaster() { return broadcaster_; }

private:
    DispatchResult reject(Connection& connection, DispatchOutcome outcome);
    DispatchResult finish(Connection& connection, DispatchOutcome outcome);

    std::shared_ptr<const HandlerTable> handlers_;
    ChannelLayerInterface& channelLayer_;
    std::shared_ptr<const ConsumerConfig> config_;
    GroupBroadcaster broadcaster_;
};

} // namespace Switchboard
