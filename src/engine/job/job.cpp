#include "job.hpp"

namespace Gleaner {
namespace Engine {
namespace Job {

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Queued: return "queued";
        case JobStatus::Running: return "running";
        case JobStatus::Paused: return "paused";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed
           || status == JobStatus::Cancelled;
}

}  // namespace Job
}  // namespace Engine
}  // namespace Gleaner
