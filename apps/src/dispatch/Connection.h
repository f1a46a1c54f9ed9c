#pragma once

#include "ClientSinkInterface.h"
#include "ConsumerConfig.h"
#include "Errors.h"
#include "core/Result.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace Switchboard {

enum class ConnectionState { Connecting, Authenticating, Open, Closing, Closed };

const char* toString(ConnectionState state);

// Close code sent when authentication is refused.
inline constexpr int kAuthenticationFailedCloseCode = 4003;

/**
 * @brief What the client asked for when it opened the socket.
 */
struct ConnectionRequest {
    std::string path;
    std::map<std::string, std::string> query;
    std::string remoteAddress;

    std::optional<std::string> queryValue(const std::string& key) const;

    // Splits "/ws/chat?token=abc&room=1" into path and query parameters.
    static ConnectionRequest fromTarget(const std::string& target, std::string remoteAddress = "");
};

/**
 * @brief One live socket.
 *
 * Owned by its ConnectionTask. Group memberships and identity are only changed
 * from that task; the state may be read from any thread.
 */
class Connection {
public:
    Connection(
        std::string id,
        std::shared_ptr<ClientSinkInterface> sink,
        std::shared_ptr<const ConsumerConfig> config,
        ConnectionRequest request = {});

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Unicast address on the channel layer.
    const std::string& id() const { return id_; }

    const std::optional<std::string>& identity() const { return identity_; }
    void setIdentity(std::optional<std::string> identity) { identity_ = std::move(identity); }

    const std::set<std::string>& groups() const { return groups_; }
    bool isMember(const std::string& group) const { return groups_.count(group) > 0; }
    bool addGroup(const std::string& group) { return groups_.insert(group).second; }
    bool removeGroup(const std::string& group) { return groups_.erase(group) > 0; }

    ConnectionState state() const { return state_.load(); }
    void setState(ConnectionState state);
    bool isOpen() const { return state() == ConnectionState::Open; }

    void touch();
    std::chrono::steady_clock::time_point lastActivity() const;

    const ConsumerConfig& config() const { return *config_; }
    const ConnectionRequest& request() const { return request_; }

    /**
     * @brief Serializes and sends one message to this connection's client.
     * Logs the message unless its discriminator is excluded from logging.
     */
    Result<std::monostate, TransportError> send(const nlohmann::json& message);

    void close(int code, const std::string& reason);

    static std::string generateId();

private:
    std::string id_;
    std::shared_ptr<ClientSinkInterface> sink_;
    std::shared_ptr<const ConsumerConfig> config_;
    ConnectionRequest request_;
    std::optional<std::string> identity_;
    std::set<std::string> groups_;
    std::atomic<ConnectionState> state_{ ConnectionState::Connecting };
    std::atomic<std::chrono::steady_clock::rep> lastActivity_;
};

} // namespace Switchboard
