#pragma once

#include "ChannelLayerInterface.h"
#include "ClientSinkInterface.h"
#include "Connection.h"
#include "Consumer.h"
#include "Dispatcher.h"
#include "EventRouter.h"
#include "core/Result.h"
#include "core/SynchronizedQueue.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

namespace Switchboard {

/**
 * @brief The sequential task serving one connection.
 *
 * Client frames and channel-layer deliveries are queued and processed one at
 * a time on a dedicated worker thread, so a handler invocation is never
 * interleaved with another unit of work for the same connection.
 */
class ConnectionTask : public ChannelReceiverInterface,
                       public std::enable_shared_from_this<ConnectionTask> {
public:
    static std::shared_ptr<ConnectionTask> create(
        std::shared_ptr<const Consumer> consumer,
        std::shared_ptr<ChannelLayerInterface> channelLayer,
        std::shared_ptr<ClientSinkInterface> sink,
        ConnectionRequest request);

    ~ConnectionTask() override;

    ConnectionTask(const ConnectionTask&) = delete;
    ConnectionTask& operator=(const ConnectionTask&) = delete;

    /**
     * @brief Authenticates, registers the channel, joins initial groups and
     * starts the worker. On authentication failure the socket is closed with
     * code 4003 and the task ends up Closed.
     */
    Result<std::monostate, std::string> start();

    void receiveText(std::string text);

    /**
     * @brief Stops the task. The in-flight item finishes, queued items are
     * discarded, groups are left and the channel is unregistered. Idempotent.
     */
    void close();

    // Blocks until the queue is drained and nothing is in flight.
    bool waitIdle(std::chrono::milliseconds timeout);

    void deliverMessage(const nlohmann::json& message) override;
    void deliverGroupMessage(const GroupEnvelope& envelope) override;
    void deliverEvent(const EventEnvelope& envelope) override;

    const std::string& id() const { return connection_.id(); }
    ConnectionState state() const { return connection_.state(); }
    const std::optional<std::string>& identity() const { return connection_.identity(); }
    const Consumer& consumer() const { return *consumer_; }

private:
    struct ClientText {
        std::string text;
    };
    struct DirectMessage {
        nlohmann::json message;
    };
    using WorkItem = std::variant<ClientText, DirectMessage, GroupEnvelope, EventEnvelope>;

    ConnectionTask(
        std::shared_ptr<const Consumer> consumer,
        std::shared_ptr<ChannelLayerInterface> channelLayer,
        std::shared_ptr<ClientSinkInterface> sink,
        ConnectionRequest request);

    void enqueue(WorkItem item);
    void run();
    void process(WorkItem& item);
    void finishItem();
    void reportTransportError(const char* what, const TransportError& error);
    void failAuthentication(const AuthenticationFailure& failure);

    std::shared_ptr<const Consumer> consumer_;
    std::shared_ptr<ChannelLayerInterface> channelLayer_;
    Connection connection_;
    Dispatcher dispatcher_;
    EventRouter router_;

    SynchronizedQueue<WorkItem> queue_;
    std::thread worker_;
    std::atomic<bool> closing_{ false };
    bool registered_ = false;

    std::mutex idleMutex_;
    std::condition_variable idleCv_;
    size_t pending_ = 0;
};

} // namespace Switchboard
