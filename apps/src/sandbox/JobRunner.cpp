#include "JobRunner.h"
#include "api/JobsApi.h"
#include "core/LoggingChannels.h"

namespace Switchboard {
namespace Sandbox {

using namespace SandboxApi;

JobRunner::JobRunner(
    std::shared_ptr<ChannelLayerInterface> channelLayer,
    std::string discriminatorField,
    std::chrono::milliseconds stepDelay,
    std::string announceGroup)
    : channelLayer_(std::move(channelLayer)),
      discriminatorField_(std::move(discriminatorField)),
      stepDelay_(stepDelay),
      announceGroup_(std::move(announceGroup))
{}

JobRunner::~JobRunner()
{
    stop();
}

void JobRunner::start()
{
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this] { run(); });
    LOG_INFO(Sandbox, "Job runner started (step {} ms)", stepDelay_.count());
}

void JobRunner::stop()
{
    if (stopping_.exchange(true)) {
        return;
    }
    queue_.stop();
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = 0;
    }
    cv_.notify_all();
    LOG_INFO(Sandbox, "Job runner stopped");
}

bool JobRunner::submit(Job& job)
{
    if (stopping_.load()) {
        return false;
    }
    job.id = "job-" + std::to_string(nextJobId_.fetch_add(1));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_;
    }
    if (!queue_.push(job)) {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
        return false;
    }
    LOG_DEBUG(Sandbox, "Queued {} '{}' for {}", job.id, job.name, job.channel);
    return true;
}

bool JobRunner::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}

void JobRunner::run()
{
    while (auto job = queue_.waitPop()) {
        runJob(job.value());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_ > 0) {
                --pending_;
            }
        }
        cv_.notify_all();
    }
}

void JobRunner::runJob(const Job& job)
{
    LOG_INFO(Sandbox, "Running {} '{}' ({} steps)", job.id, job.name, job.steps);

    for (int step = 1; step <= job.steps; ++step) {
        if (!sleepStep()) {
            LOG_INFO(Sandbox, "{} abandoned at step {}", job.id, step);
            return;
        }
        const JobProgress progress{ { job.id, step, job.steps } };
        if (!sendEvent(job, encodeMessage(progress, discriminatorField_))) {
            return;
        }
    }

    if (!sendEvent(job, encodeMessage(JobFinished{ { job.id, job.name } }, discriminatorField_))) {
        return;
    }

    auto announcement = EventEnvelope::broadcast(
        announceGroup_, encodeMessage(JobAnnouncement{ { job.name, job.owner } }, discriminatorField_));
    announcement.from(job.channel, job.owner);
    auto status = channelLayer_->broadcastEvent(announceGroup_, announcement);
    if (status.isError()) {
        LOG_ERROR(Sandbox, "Announcing {} failed: {}", job.id, status.errorValue().toString());
    }
}

bool JobRunner::sleepStep()
{
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, stepDelay_, [this] { return stopping_.load(); });
}

bool JobRunner::sendEvent(const Job& job, const nlohmann::json& event)
{
    auto envelope = EventEnvelope::unicast(job.channel, event);
    envelope.from(job.channel, job.owner);
    auto status = channelLayer_->sendEvent(job.channel, envelope);
    if (status.isError()) {
        // Usually the submitter disconnected.
        LOG_WARN(Sandbox, "Dropping {}: {}", job.id, status.errorValue().toString());
        return false;
    }
    return true;
}

} // namespace Sandbox
} // namespace Switchboard
