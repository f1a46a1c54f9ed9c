#pragma once

#include "dispatch/MessageTraits.h"
#include <optional>
#include <string>

namespace Switchboard {
namespace SandboxApi {

struct JobRequest {
    std::string name;
    int steps = 3;
};

struct SubmitJob {
    SWITCHBOARD_ACTION("submit_job");
    SWITCHBOARD_DESCRIPTION("Queue a background job; progress arrives as events");
    JobRequest payload;
};

struct JobRef {
    std::string jobId;
    std::string name;
};

struct JobAccepted {
    SWITCHBOARD_ACTION("job_accepted");
    JobRef payload;
};

// Events raised by the JobRunner.
struct JobStep {
    std::string jobId;
    int step = 0;
    int steps = 0;
};

struct JobProgress {
    SWITCHBOARD_ACTION("job_progress");
    JobStep payload;
};

struct JobFinished {
    SWITCHBOARD_ACTION("job_finished");
    JobRef payload;
};

struct JobSummary {
    std::string name;
    std::optional<std::string> owner;
};

struct JobAnnouncement {
    SWITCHBOARD_ACTION("job_announcement");
    JobSummary payload;
};

} // namespace SandboxApi
} // namespace Switchboard
