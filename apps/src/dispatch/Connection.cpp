#include "Connection.h"
#include "WireFormat.h"
#include "core/LoggingChannels.h"
#include <cctype>
#include <cstdlib>

namespace Switchboard {

namespace {
std::atomic<uint64_t> nextConnectionId{ 1 };

std::string percentDecode(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            result.push_back(' ');
        }
        else if (
            text[i] == '%' && i + 2 < text.size()
            && std::isxdigit(static_cast<unsigned char>(text[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            const std::string hex = text.substr(i + 1, 2);
            result.push_back(static_cast<char>(std::strtol(hex.c_str(), nullptr, 16)));
            i += 2;
        }
        else {
            result.push_back(text[i]);
        }
    }
    return result;
}
} // namespace

const char* toString(ConnectionState state)
{
    switch (state) {
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Authenticating:
            return "Authenticating";
        case ConnectionState::Open:
            return "Open";
        case ConnectionState::Closing:
            return "Closing";
        case ConnectionState::Closed:
            return "Closed";
    }
    return "Unknown";
}

std::optional<std::string> ConnectionRequest::queryValue(const std::string& key) const
{
    auto it = query.find(key);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

ConnectionRequest ConnectionRequest::fromTarget(const std::string& target, std::string remoteAddress)
{
    ConnectionRequest request;
    request.remoteAddress = std::move(remoteAddress);

    const auto queryPos = target.find('?');
    request.path = target.substr(0, queryPos);
    if (queryPos == std::string::npos) {
        return request;
    }

    const std::string query = target.substr(queryPos + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        const auto ampPos = query.find('&', pos);
        const auto partLen = ampPos == std::string::npos ? std::string::npos : ampPos - pos;
        const std::string part = query.substr(pos, partLen);
        if (!part.empty()) {
            const auto eqPos = part.find('=');
            if (eqPos == std::string::npos) {
                request.query[percentDecode(part)] = "";
            }
            else {
                request.query[percentDecode(part.substr(0, eqPos))] =
                    percentDecode(part.substr(eqPos + 1));
            }
        }
        if (ampPos == std::string::npos) {
            break;
        }
        pos = ampPos + 1;
    }

    return request;
}

Connection::Connection(
    std::string id,
    std::shared_ptr<ClientSinkInterface> sink,
    std::shared_ptr<const ConsumerConfig> config,
    ConnectionRequest request)
    : id_(std::move(id)),
      sink_(std::move(sink)),
      config_(config ? std::move(config) : std::make_shared<const ConsumerConfig>()),
      request_(std::move(request)),
      lastActivity_(std::chrono::steady_clock::now().time_since_epoch().count())
{}

void Connection::setState(ConnectionState state)
{
    const ConnectionState previous = state_.exchange(state);
    if (previous != state) {
        LOG_DEBUG(Transport, "{}: {} -> {}", id_, toString(previous), toString(state));
    }
}

void Connection::touch()
{
    lastActivity_.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

std::chrono::steady_clock::time_point Connection::lastActivity() const
{
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(lastActivity_.load()));
}

Result<std::monostate, TransportError> Connection::send(const nlohmann::json& message)
{
    if (state() == ConnectionState::Closed || !sink_ || !sink_->isOpen()) {
        return Result<std::monostate, TransportError>::error(
            TransportError{ "send", id_, "Connection closed" });
    }

    const std::string text = WireFormat::serialize(message);
    const std::string tag = WireFormat::logLabel(message, config_->discriminatorField);
    if (config_->shouldLogSent(tag)) {
        LOG_INFO(Dispatch, "{} <- {}", id_, text);
    }

    auto result = sink_->sendText(text);
    if (result.isError()) {
        LOG_WARN(Transport, "Send to {} failed: {}", id_, result.errorValue());
        return Result<std::monostate, TransportError>::error(
            TransportError{ "send", id_, result.errorValue() });
    }

    touch();
    return Result<std::monostate, TransportError>::okay(std::monostate{});
}

void Connection::close(int code, const std::string& reason)
{
    if (sink_ && sink_->isOpen()) {
        LOG_INFO(Transport, "Closing {} (code {}: {})", id_, code, reason);
        sink_->close(code, reason);
    }
}

std::string Connection::generateId()
{
    return "conn_" + std::to_string(nextConnectionId.fetch_add(1));
}

} // namespace Switchboard
