#pragma once

#include "dispatch/AuthenticatorInterface.h"
#include "dispatch/Consumer.h"
#include "dispatch/Errors.h"
#include "core/Result.h"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {
namespace Sandbox {

/**
 * @brief The /ws/chat consumer: ping, chat to rooms, join and leave rooms.
 *
 * New connections join `defaultRooms` and get a welcome message.
 */
Result<std::shared_ptr<const Consumer>, ConstructionError> makeChatConsumer(
    const ConsumerConfig& config,
    std::shared_ptr<AuthenticatorInterface> authenticator,
    std::vector<std::string> defaultRooms);

} // namespace Sandbox
} // namespace Switchboard
