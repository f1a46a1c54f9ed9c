#pragma once

#include <stdexcept>
#include <string>

namespace Switchboard {

/**
 * @brief Reasons a handler registry refuses to build.
 */
struct ConstructionError {
    enum class Kind {
        DuplicateDiscriminator,
        InputTypeMismatch,
        InvalidDiscriminator,
        OutputTypeMismatch,
    };

    Kind kind = Kind::InvalidDiscriminator;
    std::string discriminator;
    std::string message;
};

const char* toString(ConstructionError::Kind kind);

/**
 * @brief Failure of a channel-layer primitive or of a send to a client socket.
 */
struct TransportError {
    std::string operation;
    std::string target;
    std::string message;

    std::string toString() const;
};

/**
 * @brief TransportError raised through handler code.
 *
 * HandlerContext helpers throw this so that handlers stay free of Result
 * plumbing; the Dispatcher and EventRouter turn it back into a TransportError.
 */
class TransportException : public std::runtime_error {
public:
    explicit TransportException(TransportError error);

    const TransportError& error() const { return error_; }

private:
    TransportError error_;
};

} // namespace Switchboard
