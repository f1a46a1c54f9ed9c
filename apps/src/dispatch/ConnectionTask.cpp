#include "ConnectionTask.h"
#include "HandlerContext.h"
#include "SystemMessages.h"
#include "core/LoggingChannels.h"

namespace Switchboard {

template <typename T>
inline constexpr bool dependent_false_v = false;

std::shared_ptr<ConnectionTask> ConnectionTask::create(
    std::shared_ptr<const Consumer> consumer,
    std::shared_ptr<ChannelLayerInterface> channelLayer,
    std::shared_ptr<ClientSinkInterface> sink,
    ConnectionRequest request)
{
    return std::shared_ptr<ConnectionTask>(new ConnectionTask(
        std::move(consumer), std::move(channelLayer), std::move(sink), std::move(request)));
}

ConnectionTask::ConnectionTask(
    std::shared_ptr<const Consumer> consumer,
    std::shared_ptr<ChannelLayerInterface> channelLayer,
    std::shared_ptr<ClientSinkInterface> sink,
    ConnectionRequest request)
    : consumer_(std::move(consumer)),
      channelLayer_(std::move(channelLayer)),
      connection_(Connection::generateId(), std::move(sink), consumer_->config(), std::move(request)),
      dispatcher_(consumer_->handlers(), *channelLayer_, consumer_->config()),
      router_(consumer_->handlers(), *channelLayer_, consumer_->config())
{}

ConnectionTask::~ConnectionTask()
{
    close();
}

Result<std::monostate, std::string> ConnectionTask::start()
{
    using StartResult = Result<std::monostate, std::string>;

    if (connection_.state() != ConnectionState::Connecting) {
        return StartResult::error("Connection task already started");
    }

    const ConsumerConfig& config = *consumer_->config();
    LOG_INFO(
        Auth,
        "{} connecting to {} ({})",
        connection_.id(),
        consumer_->name(),
        connection_.request().remoteAddress.empty() ? "local" : connection_.request().remoteAddress);

    connection_.setState(ConnectionState::Authenticating);
    auto auth = consumer_->authenticator().authenticate(connection_.request());
    if (auth.isError()) {
        failAuthentication(auth.errorValue());
        return StartResult::error(
            "Authentication failed: " + std::to_string(auth.errorValue().statusCode) + " "
            + auth.errorValue().statusText);
    }
    connection_.setIdentity(auth.value().identity);

    auto registered = channelLayer_->registerChannel(connection_.id(), weak_from_this());
    if (registered.isError()) {
        LOG_ERROR(
            Transport,
            "Cannot register {}: {}",
            connection_.id(),
            registered.errorValue().toString());
        connection_.setState(ConnectionState::Closing);
        connection_.close(1011, "Channel layer unavailable");
        connection_.setState(ConnectionState::Closed);
        return StartResult::error(registered.errorValue().toString());
    }
    registered_ = true;

    for (const auto& group : consumer_->buildGroups(connection_)) {
        auto joined = dispatcher_.broadcaster().join(connection_, group);
        if (joined.isError()) {
            LOG_ERROR(
                Groups,
                "{} could not join {}: {}",
                connection_.id(),
                group,
                joined.errorValue().toString());
        }
    }

    connection_.setState(ConnectionState::Open);
    LOG_INFO(
        Auth,
        "{} authenticated as {}",
        connection_.id(),
        connection_.identity().value_or("<anonymous>"));

    if (config.sendAuthenticationMessage) {
        auto sent = connection_.send(
            SystemMessages::authentication(config.discriminatorField, 200, "OK"));
        if (sent.isError()) {
            reportTransportError("authentication message", sent.errorValue());
        }
    }

    if (const auto& hook = consumer_->postAuthentication()) {
        HandlerContext context(connection_, *channelLayer_, dispatcher_.broadcaster());
        try {
            hook(context);
        }
        catch (const TransportException& e) {
            reportTransportError("post-authentication hook", e.error());
        }
        catch (const std::exception& e) {
            LOG_ERROR(Auth, "Post-authentication hook failed for {}: {}", connection_.id(), e.what());
        }
        catch (...) {
            LOG_ERROR(Auth, "Post-authentication hook failed for {}: unknown exception", connection_.id());
        }
    }

    worker_ = std::thread([this] { run(); });
    return StartResult::okay(std::monostate{});
}

void ConnectionTask::failAuthentication(const AuthenticationFailure& failure)
{
    const ConsumerConfig& config = *consumer_->config();
    LOG_WARN(
        Auth,
        "{} rejected: {} {}",
        connection_.id(),
        failure.statusCode,
        failure.statusText);

    if (config.sendAuthenticationMessage) {
        auto sent = connection_.send(SystemMessages::authentication(
            config.discriminatorField, failure.statusCode, failure.statusText));
        if (sent.isError()) {
            reportTransportError("authentication message", sent.errorValue());
        }
    }

    connection_.setState(ConnectionState::Closing);
    connection_.close(kAuthenticationFailedCloseCode, failure.statusText);
    connection_.setState(ConnectionState::Closed);
}

void ConnectionTask::receiveText(std::string text)
{
    enqueue(ClientText{ std::move(text) });
}

void ConnectionTask::deliverMessage(const nlohmann::json& message)
{
    enqueue(DirectMessage{ message });
}

void ConnectionTask::deliverGroupMessage(const GroupEnvelope& envelope)
{
    enqueue(envelope);
}

void ConnectionTask::deliverEvent(const EventEnvelope& envelope)
{
    enqueue(envelope);
}

void ConnectionTask::enqueue(WorkItem item)
{
    if (closing_.load()) {
        LOG_DEBUG(Transport, "{} is closing, dropping queued work", connection_.id());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        ++pending_;
    }
    if (!queue_.push(std::move(item))) {
        finishItem();
    }
}

void ConnectionTask::run()
{
    while (auto item = queue_.waitPop()) {
        process(item.value());
        finishItem();
    }
}

void ConnectionTask::finishItem()
{
    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        if (pending_ > 0) {
            --pending_;
        }
    }
    idleCv_.notify_all();
}

bool ConnectionTask::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(idleMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

void ConnectionTask::process(WorkItem& item)
{
    std::visit(
        [this](auto& work) {
            using T = std::decay_t<decltype(work)>;

            if constexpr (std::is_same_v<T, ClientText>) {
                auto result = dispatcher_.dispatch(connection_, work.text);
                if (result.isError()) {
                    reportTransportError("dispatch", result.errorValue());
                    return;
                }
                const DispatchOutcome& outcome = result.value();
                switch (outcome.status) {
                    case DispatchStatus::Handled:
                        LOG_DEBUG(
                            Dispatch,
                            "{} handled '{}' ({} broadcasts)",
                            connection_.id(),
                            outcome.discriminator,
                            outcome.broadcasts);
                        break;
                    case DispatchStatus::ValidationFailed:
                        LOG_DEBUG(
                            Dispatch,
                            "{} sent an invalid '{}' message",
                            connection_.id(),
                            outcome.discriminator);
                        break;
                    case DispatchStatus::HandlerFailed:
                        LOG_WARN(
                            Dispatch,
                            "{} handler for '{}' failed",
                            connection_.id(),
                            outcome.discriminator);
                        break;
                    case DispatchStatus::Dropped:
                        break;
                }
            }
            else if constexpr (std::is_same_v<T, DirectMessage>) {
                if (!connection_.isOpen()) {
                    return;
                }
                auto result = connection_.send(work.message);
                if (result.isError()) {
                    reportTransportError("direct message", result.errorValue());
                }
            }
            else if constexpr (std::is_same_v<T, GroupEnvelope>) {
                if (!connection_.isOpen()) {
                    return;
                }
                auto result = dispatcher_.broadcaster().deliver(connection_, work);
                if (result.isError()) {
                    reportTransportError("group message", result.errorValue());
                }
            }
            else if constexpr (std::is_same_v<T, EventEnvelope>) {
                auto result = router_.routeEvent(connection_, work);
                if (result.isError()) {
                    reportTransportError("event", result.errorValue());
                    return;
                }
                const RouteOutcome& outcome = result.value();
                switch (outcome.status) {
                    case RouteStatus::Handled:
                        LOG_DEBUG(
                            Events,
                            "{} handled event '{}'",
                            connection_.id(),
                            outcome.discriminator);
                        break;
                    case RouteStatus::RoutingFailed:
                    case RouteStatus::HandlerFailed:
                        LOG_DEBUG(
                            Events,
                            "{} dropped event '{}': {}",
                            connection_.id(),
                            outcome.discriminator,
                            toString(outcome.status));
                        break;
                    case RouteStatus::Dropped:
                        break;
                }
            }
            else {
                static_assert(dependent_false_v<T>, "Unhandled work item type");
            }
        },
        item);
}

void ConnectionTask::reportTransportError(const char* what, const TransportError& error)
{
    LOG_ERROR(Transport, "{}: {} failed: {}", connection_.id(), what, error.toString());
}

void ConnectionTask::close()
{
    if (closing_.exchange(true)) {
        return;
    }

    const ConnectionState previous = connection_.state();
    if (previous != ConnectionState::Closed) {
        connection_.setState(ConnectionState::Closing);
    }

    queue_.stop();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        }
        else {
            worker_.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(idleMutex_);
        pending_ = 0;
    }
    idleCv_.notify_all();

    if (registered_) {
        auto left = dispatcher_.broadcaster().leaveAll(connection_);
        if (left.isError()) {
            reportTransportError("leave groups", left.errorValue());
        }
        auto unregistered = channelLayer_->unregisterChannel(connection_.id());
        if (unregistered.isError()) {
            reportTransportError("unregister", unregistered.errorValue());
        }
        registered_ = false;
    }

    if (previous != ConnectionState::Closed) {
        connection_.close(1000, "Connection closed");
        connection_.setState(ConnectionState::Closed);
        LOG_INFO(Transport, "{} closed", connection_.id());
    }
}

} // namespace Switchboard
