#pragma once

#include "core/Result.h"
#include "dispatch/ChannelLayerInterface.h"
#include "dispatch/Consumer.h"
#include "dispatch/ConnectionTask.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <rtc/rtc.hpp>
#include <string>
#include <variant>

namespace Switchboard {
namespace Network {

/**
 * @brief WebSocket front end for one or more Consumers.
 *
 * Server role: each accepted socket is matched by request path to a Consumer
 * and served by its own ConnectionTask. Text frames go to the task; binary
 * frames are ignored. The query string is handed to the Consumer's
 * authenticator.
 *
 * Client role: a single outgoing text connection, used by tools and tests.
 */
class WebSocketService {
public:
    using TextCallback = std::function<void(const std::string&)>;
    using ConnectionCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // A null channel layer means a private InMemoryChannelLayer.
    explicit WebSocketService(std::shared_ptr<ChannelLayerInterface> channelLayer = nullptr);
    ~WebSocketService();

    WebSocketService(const WebSocketService&) = delete;
    WebSocketService& operator=(const WebSocketService&) = delete;

    // Server role.
    void route(const std::string& path, std::shared_ptr<const Consumer> consumer);
    Result<std::monostate, std::string> listen(
        uint16_t port, const std::string& bindAddress = "0.0.0.0");
    bool isListening() const;
    void stopListening();
    size_t connectionCount() const;

    const std::shared_ptr<ChannelLayerInterface>& channelLayer() const { return channelLayer_; }

    // Client role.
    Result<std::monostate, std::string> connect(const std::string& url, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;
    Result<std::monostate, std::string> sendText(const std::string& message);

    void onText(TextCallback callback) { textCallback_ = std::move(callback); }
    void onDisconnected(ConnectionCallback callback) { disconnectedCallback_ = std::move(callback); }
    void onError(ErrorCallback callback) { errorCallback_ = std::move(callback); }

private:
    struct ServerClient {
        std::shared_ptr<rtc::WebSocket> ws;
        std::shared_ptr<ConnectionTask> task;
    };

    void onClientConnected(std::shared_ptr<rtc::WebSocket> ws);
    void onClientOpen(const std::shared_ptr<rtc::WebSocket>& ws);
    std::shared_ptr<ConnectionTask> releaseClient(const rtc::WebSocket* ws);
    std::shared_ptr<const Consumer> findConsumer(const std::string& path) const;

    std::shared_ptr<ChannelLayerInterface> channelLayer_;

    mutable std::mutex routesMutex_;
    std::map<std::string, std::shared_ptr<const Consumer>> routes_;

    std::unique_ptr<rtc::WebSocketServer> server_;
    mutable std::mutex clientsMutex_;
    std::map<const rtc::WebSocket*, ServerClient> clients_;

    std::shared_ptr<rtc::WebSocket> ws_;
    std::atomic<bool> connectionFailed_{ false };
    TextCallback textCallback_;
    ConnectionCallback disconnectedCallback_;
    ErrorCallback errorCallback_;
};

} // namespace Network
} // namespace Switchboard
