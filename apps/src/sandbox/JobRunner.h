#pragma once

#include "core/SynchronizedQueue.h"
#include "dispatch/ChannelLayerInterface.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Switchboard {
namespace Sandbox {

struct Job {
    std::string id;
    std::string name;
    int steps = 0;
    // Channel of the connection that submitted the job.
    std::string channel;
    std::optional<std::string> owner;
};

/**
 * @brief Background worker that runs submitted jobs one after another.
 *
 * Progress and completion reach the submitting connection as unicast events;
 * completion is also announced to `announceGroup` as a broadcast event. Both
 * go through the channel layer only, never through a connection directly.
 */
class JobRunner {
public:
    JobRunner(
        std::shared_ptr<ChannelLayerInterface> channelLayer,
        std::string discriminatorField,
        std::chrono::milliseconds stepDelay,
        std::string announceGroup);
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    void start();
    void stop();

    // Assigns the job id and queues the job. Returns false once stopped.
    bool submit(Job& job);

    // Blocks until every submitted job has finished.
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    void run();
    void runJob(const Job& job);
    bool sleepStep();
    bool sendEvent(const Job& job, const nlohmann::json& event);

    std::shared_ptr<ChannelLayerInterface> channelLayer_;
    std::string discriminatorField_;
    std::chrono::milliseconds stepDelay_;
    std::string announceGroup_;

    SynchronizedQueue<Job> queue_;
    std::thread worker_;
    std::atomic<bool> stopping_{ false };
    std::atomic<uint64_t> nextJobId_{ 1 };

    std::mutex mutex_;
    std::condition_variable cv_;
    size_t pending_ = 0;
};

} // namespace Sandbox
} // namespace Switchboard
