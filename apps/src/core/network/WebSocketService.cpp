#include "WebSocketService.h"
#include "core/LoggingChannels.h"
#include "dispatch/InMemoryChannelLayer.h"
#include <chrono>
#include <thread>

namespace Switchboard {
namespace Network {

namespace {

constexpr size_t kMaxMessageSize = 4 * 1024 * 1024;

/**
 * @brief ClientSinkInterface over a libdatachannel socket.
 *
 * rtc::WebSocket::close() carries no close code, so the code is only logged.
 */
class RtcClientSink : public ClientSinkInterface {
public:
    explicit RtcClientSink(std::weak_ptr<rtc::WebSocket> ws) : ws_(std::move(ws)) {}

    Result<std::monostate, std::string> sendText(const std::string& text) override
    {
        auto ws = ws_.lock();
        if (!ws || !ws->isOpen()) {
            return Result<std::monostate, std::string>::error("Socket is not open");
        }
        try {
            ws->send(text);
        }
        catch (const std::exception& e) {
            return Result<std::monostate, std::string>::error(
                std::string("Send failed: ") + e.what());
        }
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }

    void close(int code, const std::string& reason) override
    {
        auto ws = ws_.lock();
        if (!ws || ws->isClosed()) {
            return;
        }
        LOG_DEBUG(Network, "Closing socket ({} {})", code, reason);
        ws->close();
    }

    bool isOpen() const override
    {
        auto ws = ws_.lock();
        return ws && ws->isOpen();
    }

private:
    std::weak_ptr<rtc::WebSocket> ws_;
};

} // namespace

WebSocketService::WebSocketService(std::shared_ptr<ChannelLayerInterface> channelLayer)
    : channelLayer_(channelLayer ? std::move(channelLayer) : std::make_shared<InMemoryChannelLayer>())
{
    LOG_DEBUG(Network, "WebSocketService created");
}

WebSocketService::~WebSocketService()
{
    disconnect();
    stopListening();
}

void WebSocketService::route(const std::string& path, std::shared_ptr<const Consumer> consumer)
{
    std::lock_guard<std::mutex> lock(routesMutex_);
    LOG_INFO(Network, "Routing {} to consumer '{}'", path, consumer->name());
    routes_[path] = std::move(consumer);
}

std::shared_ptr<const Consumer> WebSocketService::findConsumer(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(routesMutex_);
    auto it = routes_.find(path);
    if (it == routes_.end()) {
        return nullptr;
    }
    return it->second;
}

Result<std::monostate, std::string> WebSocketService::listen(
    uint16_t port, const std::string& bindAddress)
{
    try {
        LOG_INFO(Network, "Starting server on {}:{}", bindAddress, port);

        rtc::WebSocketServerConfiguration config;
        config.port = port;
        config.bindAddress = bindAddress;
        config.enableTls = false;
        config.maxMessageSize = kMaxMessageSize;

        server_ = std::make_unique<rtc::WebSocketServer>(config);
        server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) { onClientConnected(ws); });

        LOG_INFO(Network, "Server started on port {}", server_->port());
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        server_.reset();
        return Result<std::monostate, std::string>::error(
            std::string("Failed to start server: ") + e.what());
    }
}

bool WebSocketService::isListening() const
{
    return server_ != nullptr;
}

void WebSocketService::stopListening()
{
    if (!server_) {
        return;
    }

    std::map<const rtc::WebSocket*, ServerClient> clients;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clients.swap(clients_);
    }

    for (auto& [key, client] : clients) {
        client.ws->onClosed([]() {});
        client.ws->onError([](const std::string&) {});
        client.ws->onMessage([](std::variant<rtc::binary, rtc::string>) {});
        if (client.task) {
            client.task->close();
        }
        else if (!client.ws->isClosed()) {
            client.ws->close();
        }
    }

    server_->stop();
    server_.reset();
    LOG_INFO(Network, "Server stopped");
}

size_t WebSocketService::connectionCount() const
{
    std::lock_guard<std::mutex> lock(clientsMutex_);
    size_t count = 0;
    for (const auto& [key, client] : clients_) {
        if (client.task) {
            ++count;
        }
    }
    return count;
}

void WebSocketService::onClientConnected(std::shared_ptr<rtc::WebSocket> ws)
{
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clients_[ws.get()] = ServerClient{ ws, nullptr };
    }

    std::weak_ptr<rtc::WebSocket> weak = ws;
    ws->onOpen([this, weak]() {
        if (auto socket = weak.lock()) {
            onClientOpen(socket);
        }
    });

    ws->onClosed([this, weak]() {
        auto socket = weak.lock();
        if (!socket) {
            return;
        }
        auto task = releaseClient(socket.get());
        if (task) {
            LOG_INFO(Network, "Client {} disconnected", task->id());
            task->close();
        }
    });

    ws->onError([](std::string error) { LOG_ERROR(Network, "Client error: {}", error); });
}

void WebSocketService::onClientOpen(const std::shared_ptr<rtc::WebSocket>& ws)
{
    const auto target = ws->path().value_or("/");
    const auto remoteAddress = ws->remoteAddress().value_or("unknown");
    auto request = ConnectionRequest::fromTarget(target, remoteAddress);

    auto consumer = findConsumer(request.path);
    if (!consumer) {
        LOG_WARN(Network, "Rejecting client from {}: no consumer at {}", remoteAddress, request.path);
        releaseClient(ws.get());
        ws->close();
        return;
    }

    auto sink = std::make_shared<RtcClientSink>(ws);
    auto task = ConnectionTask::create(consumer, channelLayer_, sink, std::move(request));

    auto started = task->start();
    if (started.isError()) {
        LOG_WARN(Network, "Client from {} refused: {}", remoteAddress, started.errorValue());
        releaseClient(ws.get());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        auto it = clients_.find(ws.get());
        if (it == clients_.end()) {
            // Closed or stopped while authenticating.
            task->close();
            return;
        }
        it->second.task = task;
    }

    std::weak_ptr<ConnectionTask> weakTask = task;
    ws->onMessage([weakTask](std::variant<rtc::binary, rtc::string> data) {
        auto task = weakTask.lock();
        if (!task) {
            return;
        }
        if (std::holds_alternative<rtc::string>(data)) {
            task->receiveText(std::move(std::get<rtc::string>(data)));
        }
        else {
            LOG_WARN(
                Network,
                "Ignoring binary frame ({} bytes) from {}",
                std::get<rtc::binary>(data).size(),
                task->id());
        }
    });

    LOG_INFO(Network, "Client {} connected to {} from {}", task->id(), consumer->name(), remoteAddress);
}

std::shared_ptr<ConnectionTask> WebSocketService::releaseClient(const rtc::WebSocket* ws)
{
    std::lock_guard<std::mutex> lock(clientsMutex_);
    auto it = clients_.find(ws);
    if (it == clients_.end()) {
        return nullptr;
    }
    auto task = std::move(it->second.task);
    clients_.erase(it);
    return task;
}

Result<std::monostate, std::string> WebSocketService::connect(const std::string& url, int timeoutMs)
{
    try {
        LOG_INFO(Network, "Connecting to {}", url);
        connectionFailed_ = false;

        rtc::WebSocketConfiguration config;
        config.maxMessageSize = kMaxMessageSize;
        ws_ = std::make_shared<rtc::WebSocket>(config);

        ws_->onMessage([this](std::variant<rtc::binary, rtc::string> data) {
            if (!std::holds_alternative<rtc::string>(data)) {
                LOG_DEBUG(Network, "Ignoring binary frame");
                return;
            }
            const std::string& message = std::get<rtc::string>(data);
            LOG_DEBUG(Network, "Received text ({} bytes)", message.size());
            if (textCallback_) {
                textCallback_(message);
            }
        });

        ws_->onOpen([]() { LOG_DEBUG(Network, "Connection opened"); });

        ws_->onClosed([this]() {
            LOG_DEBUG(Network, "Connection closed");
            connectionFailed_ = true;
            if (disconnectedCallback_) {
                disconnectedCallback_();
            }
        });

        ws_->onError([this](std::string error) {
            LOG_ERROR(Network, "WebSocketService error: {}", error);
            connectionFailed_ = true;
            if (errorCallback_) {
                errorCallback_(error);
            }
        });

        ws_->open(url);

        if (timeoutMs <= 0) {
            LOG_INFO(Network, "Connection initiated to {} (async mode)", url);
            return Result<std::monostate, std::string>::okay(std::monostate{});
        }

        auto startTime = std::chrono::steady_clock::now();
        while (!ws_->isOpen() && !connectionFailed_) {
            auto elapsed = std::chrono::steady_clock::now() - startTime;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeoutMs) {
                return Result<std::monostate, std::string>::error("Connection timeout");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (connectionFailed_) {
            return Result<std::monostate, std::string>::error("Connection failed");
        }

        LOG_INFO(Network, "Connected to {}", url);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(
            std::string("Connection error: ") + e.what());
    }
}

void WebSocketService::disconnect()
{
    if (ws_) {
        ws_->onClosed([]() {});
        ws_->onError([](const std::string&) {});
        ws_->onMessage([](std::variant<rtc::binary, rtc::string>) {});
        if (ws_->isOpen()) {
            ws_->close();
        }
        ws_.reset();
    }
}

bool WebSocketService::isConnected() const
{
    return ws_ && ws_->isOpen();
}

Result<std::monostate, std::string> WebSocketService::sendText(const std::string& message)
{
    if (!isConnected()) {
        return Result<std::monostate, std::string>::error("Not connected");
    }

    try {
        ws_->send(message);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(std::string("Send failed: ") + e.what());
    }
}

} // namespace Network
} // namespace Switchboard
