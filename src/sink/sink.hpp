#pragma once
#include <vector>
#include "../engine/job/job.hpp"

namespace Gleaner {
namespace Sink {

class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    // Called after every page and on every status change. Calls for one job
    // never overlap and carry non-decreasing page counts.
    virtual void on_progress(const Engine::Job::ProgressEvent& event) = 0;
};

class ResultSink {
public:
    virtual ~ResultSink() = default;

    // Called once per job when it reaches a terminal state. Pages are
    // ordered by seed, then by page number.
    virtual void on_job_finished(const Engine::Job::JobSnapshot&             snapshot,
                                 const std::vector<Engine::Job::PageResult>& pages) = 0;
};

}  // namespace Sink
}  // namespace Gleaner
