#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/sync/cancel_token.hpp"
#include "../../core/types/constants.hpp"
#include "../../extract/engine/extraction_engine.hpp"
#include "../../extract/query/document_query.hpp"
#include "../../fetch/pipeline/fetch_pipeline.hpp"
#include "../../sink/sink.hpp"
#include "../job/job.hpp"

namespace Gleaner {
namespace Engine {

using namespace Gleaner::Engine::Job;

struct OrchestratorConfig {
    int                       io_threads               = Core::Constants::DEFAULT_IO_THREADS;
    int                       max_concurrent_jobs      = Core::Constants::DEFAULT_MAX_JOBS;
    int                       job_fetch_concurrency    = Core::Constants::DEFAULT_JOB_CONCURRENCY;
    int                       max_consecutive_failures = Core::Constants::MAX_CONSECUTIVE_FAILURES;
    std::chrono::milliseconds cancel_grace{Core::Constants::CANCEL_GRACE_MS};
};

/**
 * @brief Owns every job and drives it from submission to a terminal state.
 *
 * Each running job is one coroutine on its own strand of a shared
 * io_context; its page chains (one per discovery seed) run as coroutines on
 * the same strand. Public methods are thread-safe.
 */
class JobOrchestrator {
public:
    JobOrchestrator(const OrchestratorConfig&         config,
                    Fetch::Pipeline::FetchPipeline&   pipeline,
                    const Extract::Query::DocumentParser& parser,
                    Sink::ProgressSink*               progress_sink = nullptr,
                    Sink::ResultSink*                 result_sink   = nullptr);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&)            = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    /**
     * @brief Validates and registers a job; it is queued but not started.
     * @throws Core::InvalidJobError
     */
    JobId submit(JobRequest request);

    // Runs the job now if a slot is free, otherwise when one frees up (FIFO).
    void start(const JobId& id);

    // Idempotent. Running jobs stop at their next suspension point.
    void cancel(const JobId& id);
    void cancel_all();

    // Pause takes effect at the next page boundary. Both return false when
    // the job is not in a state that allows the transition.
    bool pause(const JobId& id);
    bool resume(const JobId& id);

    JobStatus                status(const JobId& id) const;
    Progress                 progress(const JobId& id) const;
    std::vector<std::string> errors(const JobId& id) const;
    std::vector<PageResult>  results(const JobId& id) const;
    JobSnapshot              snapshot(const JobId& id) const;

    // Submission order; only jobs in `status` when one is given.
    std::vector<JobId> jobs(std::optional<JobStatus> status = std::nullopt) const;

    /**
     * @brief Forgets a job whose terminal state has reached the sinks.
     * @return false when the job is still live.
     * @throws Core::InvalidJobError for an unknown id
     */
    bool remove(const JobId& id);

    JobStatus wait(const JobId& id);
    bool      wait_for(const JobId& id, std::chrono::milliseconds timeout);

    void shutdown();

#ifdef CPPCHECK
public:
#else
private:
#endif
    struct JobState {
        JobId                                              id;
        JobRequest                                         request;
        JobStatus                                          status = JobStatus::Pending;
        Progress                                           progress;
        TimePoint                                          created_at{};
        std::optional<TimePoint>                           started_at;
        std::optional<TimePoint>                           ended_at;
        std::vector<std::string>                           errors;
        std::string                                        terminal_reason;
        std::vector<std::vector<PageResult>>               chains;
        Core::CancelToken                                  cancel;
        bool                                               cancel_requested = false;
        bool                                               start_requested  = false;
        bool                                               holds_slot       = false;
        bool                                               finalized        = false;
        bool                                               settled          = false;  // sinks notified
        std::string                                        abort_reason;
        int                                                consecutive_failures = 0;
        size_t                                             pages_attempted      = 0;
        size_t                                             pages_missing_required = 0;
        std::shared_ptr<boost::asio::steady_timer>         grace_timer;

        // Touched only from the job's strand.
        std::vector<std::string> seeds;
        size_t                   next_seed     = 0;
        int                      active_chains = 0;
        std::shared_ptr<boost::asio::steady_timer> chains_done;
    };

    struct PageOutcome {
        PageResult                                     page;
        std::unique_ptr<Extract::Query::DocumentQuery> document;
    };

    // lifecycle.cpp
    void init_io_services();
    void validate(const JobRequest& request) const;
    void pump_queue();
    void launch(std::shared_ptr<JobState> job);
    void finish(const std::shared_ptr<JobState>& job);
    void finalize(const std::shared_ptr<JobState>& job, JobStatus status, const std::string& reason);
    void emit_progress(const std::shared_ptr<JobState>& job);
    void abort_job(const std::shared_ptr<JobState>& job, const std::string& reason);
    std::shared_ptr<JobState> find(const JobId& id) const;
    JobSnapshot               make_snapshot(const JobState& job) const;
    static std::vector<PageResult> flatten(const JobState& job);

    // worker.cpp
    boost::asio::awaitable<void> run_job(std::shared_ptr<JobState> job);
    boost::asio::awaitable<void> chain_worker(std::shared_ptr<JobState> job);
    boost::asio::awaitable<void> run_chain(std::shared_ptr<JobState> job,
                                           size_t                    seed,
                                           std::string               url);
    boost::asio::awaitable<std::optional<PageOutcome>> process_page(
        const std::shared_ptr<JobState>& job,
        size_t                           seed,
        int                              page_number,
        const std::string&               url);
    boost::asio::awaitable<std::vector<std::string>> discover_seeds(
        const std::shared_ptr<JobState>& job);
    boost::asio::awaitable<bool> wait_while_paused(const std::shared_ptr<JobState>& job);
    // Returns the job's consecutive page failures after recording.
    int record_page(const std::shared_ptr<JobState>& job, PageResult page);

    OrchestratorConfig                    config_;
    Fetch::Pipeline::FetchPipeline&       pipeline_;
    const Extract::Query::DocumentParser& parser_;
    Extract::Engine::ExtractionEngine     engine_;
    Sink::ProgressSink*                   progress_sink_;
    Sink::ResultSink*                     result_sink_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;

    mutable std::mutex                               mutex_;
    std::condition_variable                          done_cv_;
    std::map<JobId, std::shared_ptr<JobState>>       jobs_;
    std::vector<JobId>                               order_;
    std::deque<JobId>                                waiting_;
    int                                              running_ = 0;
    std::atomic<bool>                                is_shutdown_{false};

    // Serializes sink calls so progress events stay ordered.
    std::mutex sink_mutex_;
};

}  // namespace Engine
}  // namespace Gleaner
