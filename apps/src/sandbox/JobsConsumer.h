#pragma once

#include "JobRunner.h"
#include "core/Result.h"
#include "dispatch/AuthenticatorInterface.h"
#include "dispatch/Consumer.h"
#include "dispatch/Errors.h"
#include <memory>

namespace Switchboard {
namespace Sandbox {

inline constexpr const char* kJobsGroup = "jobs";
inline constexpr int kMaxJobSteps = 100;

/**
 * @brief The /ws/jobs consumer.
 *
 * submit_job hands the job to the JobRunner and answers job_accepted. The
 * runner's progress, completion and announcement events are routed back
 * through the event handlers declared here.
 */
Result<std::shared_ptr<const Consumer>, ConstructionError> makeJobsConsumer(
    const ConsumerConfig& config,
    std::shared_ptr<AuthenticatorInterface> authenticator,
    std::shared_ptr<JobRunner> runner);

} // namespace Sandbox
} // namespace Switchboard
