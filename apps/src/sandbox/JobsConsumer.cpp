#include "JobsConsumer.h"
#include "api/JobsApi.h"
#include "core/LoggingChannels.h"
#include "dispatch/HandlerContext.h"
#include "dispatch/SchemaRegistry.h"
#include <stdexcept>

namespace Switchboard {
namespace Sandbox {

using namespace SandboxApi;

Result<std::shared_ptr<const Consumer>, ConstructionError> makeJobsConsumer(
    const ConsumerConfig& config,
    std::shared_ptr<AuthenticatorInterface> authenticator,
    std::shared_ptr<JobRunner> runner)
{
    using ConsumerResult = Result<std::shared_ptr<const Consumer>, ConstructionError>;

    SchemaRegistry registry;

    registry.onMessage<SubmitJob>(
        [runner](HandlerContext& context, const SubmitJob& submit) {
            const JobRequest& request = submit.payload;
            if (request.steps < 1 || request.steps > kMaxJobSteps) {
                throw std::invalid_argument(
                    "steps must be between 1 and " + std::to_string(kMaxJobSteps));
            }
            Job job{ "", request.name, request.steps, context.connection().id(), context.identity() };
            if (!runner->submit(job)) {
                throw std::runtime_error("Job runner is stopped");
            }
            return JobAccepted{ { job.id, job.name } };
        },
        { .summary = "Submit a job", .tags = { "jobs" } });

    registry.onEvent<JobProgress>(
        [](HandlerContext&, const JobProgress& progress) { return progress; },
        { .tags = { "jobs" } });

    registry.onEvent<JobFinished>(
        [](HandlerContext&, const JobFinished& finished) { return finished; },
        { .tags = { "jobs" } });

    registry.onEvent<JobAnnouncement>(
        [](HandlerContext&, const JobAnnouncement& announcement) { return announcement; },
        { .tags = { "jobs" } });

    auto table = registry.build();
    if (table.isError()) {
        return ConsumerResult::error(table.errorValue());
    }

    auto consumer = std::make_shared<Consumer>("jobs", config, table.value());
    consumer->setAuthenticator(std::move(authenticator));
    consumer->setGroupBuilder(
        [](const Connection&) { return std::vector<std::string>{ kJobsGroup }; });

    LOG_INFO(Sandbox, "Jobs consumer ready ({} handlers)", table.value()->size());
    return ConsumerResult::okay(std::move(consumer));
}

} // namespace Sandbox
} // namespace Switchboard
