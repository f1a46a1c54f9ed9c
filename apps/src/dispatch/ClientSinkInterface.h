#pragma once

#include "core/Result.h"
#include <string>
#include <variant>

namespace Switchboard {

/**
 * @brief The client end of one socket, as seen by the dispatch core.
 *
 * WebSocketService wraps an rtc::WebSocket in this; tests use FakeClientSink.
 */
class ClientSinkInterface {
public:
    virtual ~ClientSinkInterface() = default;

    virtual Result<std::monostate, std::string> sendText(const std::string& text) = 0;
    virtual void close(int code, const std::string& reason) = 0;
    virtual bool isOpen() const = 0;
};

} // namespace Switchboard
