#pragma once

#include "JobRunner.h"
#include "SandboxConfig.h"
#include "core/Result.h"
#include "core/network/WebSocketService.h"
#include <atomic>
#include <memory>
#include <string>

namespace Switchboard {
namespace Sandbox {

/**
 * @brief Demo server hosting the chat and jobs consumers on one port.
 */
class SandboxServer {
public:
    explicit SandboxServer(SandboxConfig config);
    ~SandboxServer();

    Result<std::monostate, std::string> start();
    void stop();
    void mainLoopRun();
    void requestExit();

    const SandboxConfig& config() const { return config_; }
    Network::WebSocketService& service() { return wsService_; }

private:
    SandboxConfig config_;
    Network::WebSocketService wsService_;
    std::shared_ptr<JobRunner> jobRunner_;
    std::atomic<bool> shouldExit_{ false };
};

} // namespace Sandbox
} // namespace Switchboard
