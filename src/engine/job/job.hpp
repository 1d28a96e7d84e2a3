#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../../template/model/template.hpp"
#include "page_result.hpp"

namespace Gleaner {
namespace Engine {
namespace Job {

using JobId     = std::string;
using TimePoint = std::chrono::system_clock::time_point;

enum class JobStatus { Pending, Queued, Running, Paused, Completed, Failed, Cancelled };

const char* to_string(JobStatus status);
bool        is_terminal(JobStatus status);

struct JobRequest {
    std::string                                name;
    std::string                                target_url;
    std::shared_ptr<const Templates::Template> tpl;
};

struct Progress {
    JobStatus status          = JobStatus::Pending;
    size_t    pages_fetched   = 0;
    size_t    items_extracted = 0;
    size_t    items_failed    = 0;
    size_t    estimated_total = 0;  // 0 when pagination is unbounded

    // Only known when estimated_total is.
    std::optional<double> percent;
};

struct ProgressEvent {
    JobId    id;
    Progress progress;
};

struct JobSnapshot {
    JobId                    id;
    std::string              name;
    std::string              target_url;
    std::string              template_name;
    Progress                 progress;
    TimePoint                created_at{};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> ended_at;
    std::vector<std::string> errors;
    std::string              terminal_reason;
};

}  // namespace Job
}  // namespace Engine
}  // namespace Gleaner
