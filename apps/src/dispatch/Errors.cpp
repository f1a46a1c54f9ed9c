#include "Errors.h"

namespace Switchboard {

const char* toString(ConstructionError::Kind kind)
{
    switch (kind) {
        case ConstructionError::Kind::DuplicateDiscriminator:
            return "DuplicateDiscriminator";
        case ConstructionError::Kind::InputTypeMismatch:
            return "InputTypeMismatch";
        case ConstructionError::Kind::InvalidDiscriminator:
            return "InvalidDiscriminator";
        case ConstructionError::Kind::OutputTypeMismatch:
            return "OutputTypeMismatch";
    }
    return "Unknown";
}

std::string TransportError::toString() const
{
    std::string result = operation;
    if (!target.empty()) {
        result += "(" + target + ")";
    }
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

TransportException::TransportException(TransportError error)
    : std::runtime_error(error.toString()), error_(std::move(error))
{}

} // namespace Switchboard
