#include "SandboxServer.h"
#include "ChatConsumer.h"
#include "JobsConsumer.h"
#include "TokenAuthenticator.h"
#include "core/LoggingChannels.h"
#include <chrono>
#include <thread>

namespace Switchboard {
namespace Sandbox {

SandboxServer::SandboxServer(SandboxConfig config) : config_(std::move(config))
{
    jobRunner_ = std::make_shared<JobRunner>(
        wsService_.channelLayer(),
        config_.jobs.discriminatorField,
        std::chrono::milliseconds(config_.jobStepMs),
        kJobsGroup);
}

SandboxServer::~SandboxServer()
{
    stop();
}

Result<std::monostate, std::string> SandboxServer::start()
{
    using StartResult = Result<std::monostate, std::string>;

    auto authenticator = std::make_shared<TokenAuthenticator>(config_.tokens);

    auto chat = makeChatConsumer(config_.chat, authenticator, config_.defaultRooms);
    if (chat.isError()) {
        return StartResult::error("Chat consumer: " + chat.errorValue().message);
    }
    auto jobs = makeJobsConsumer(config_.jobs, authenticator, jobRunner_);
    if (jobs.isError()) {
        return StartResult::error("Jobs consumer: " + jobs.errorValue().message);
    }

    wsService_.route("/ws/chat", chat.value());
    wsService_.route("/ws/jobs", jobs.value());

    jobRunner_->start();

    auto listenResult = wsService_.listen(config_.port, config_.bindAddress);
    if (listenResult.isError()) {
        jobRunner_->stop();
        return StartResult::error(listenResult.errorValue());
    }

    LOG_INFO(Sandbox, "Sandbox listening on {}:{}", config_.bindAddress, config_.port);
    return StartResult::okay(std::monostate{});
}

void SandboxServer::stop()
{
    wsService_.stopListening();
    jobRunner_->stop();
}

void SandboxServer::mainLoopRun()
{
    LOG_INFO(Sandbox, "Sandbox main loop running");
    while (!shouldExit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    LOG_INFO(Sandbox, "Sandbox main loop exiting");
}

void SandboxServer::requestExit()
{
    shouldExit_.store(true);
}

} // namespace Sandbox
} // namespace Switchboard
