#pragma once

#include "MessageType.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Switchboard {

class HandlerContext;

enum class Direction { Client, Event };

const char* toString(Direction direction);

struct HandlerMetadata {
    std::string name;
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
};

/**
 * @brief Type-erased handler call.
 *
 * Receives a message that already passed validation and returns the encoded
 * output message, or std::nullopt when the handler produces nothing to unicast.
 */
using Invoker =
    std::function<std::optional<nlohmann::json>(HandlerContext& context, const nlohmann::json& message)>;

struct HandlerBinding {
    std::string discriminator;
    Direction direction = Direction::Client;
    Invoker invoker;
    MessageType input;
    std::vector<MessageType> outputs;
    HandlerMetadata metadata;
};

} // namespace Switchboard
