#pragma once

#include "Shape.h"
#include <string>

namespace Switchboard {

/**
 * @brief Immutable descriptor of one message kind on the wire.
 */
struct MessageType {
    std::string discriminator;
    Shape shape;
    std::string typeName;
    std::string description;
};

} // namespace Switchboard
