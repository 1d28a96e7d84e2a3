#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../extract/query/css_selector.hpp"
#include "../../../utils/url/url.hpp"
#include "../orchestrator.hpp"

namespace Gleaner {
namespace Engine {

using namespace Gleaner::Core;
using Extract::Query::SelectorParser;
using Extract::Query::SelectorSyntaxError;
using Templates::PaginationStrategy;

JobOrchestrator::JobOrchestrator(const OrchestratorConfig&             config,
                                 Fetch::Pipeline::FetchPipeline&       pipeline,
                                 const Extract::Query::DocumentParser& parser,
                                 Sink::ProgressSink*                   progress_sink,
                                 Sink::ResultSink*                     result_sink)
    : config_(config),
      pipeline_(pipeline),
      parser_(parser),
      progress_sink_(progress_sink),
      result_sink_(result_sink) {
    init_io_services();
}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
}

void JobOrchestrator::init_io_services() {
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    int threads = std::max(1, config_.io_threads);
    for (int i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("Started " + std::to_string(threads) + " IO threads.");
}

void JobOrchestrator::validate(const JobRequest& request) const {
    if (!request.tpl)
        throw InvalidJobError("Job has no template");
    if (!Utils::Url::is_http_url(request.target_url))
        throw InvalidJobError("Invalid target URL: '" + request.target_url + "'");

    const auto& tpl = *request.tpl;
    if (tpl.fields.empty())
        throw InvalidJobError("Template '" + tpl.name + "' has no fields");

    auto check = [&](const std::string& what, const std::string& selector) {
        if (selector.empty())
            throw InvalidJobError("Template '" + tpl.name + "': empty selector for " + what);
        try {
            SelectorParser::parse(selector);
        } catch (const SelectorSyntaxError& e) {
            throw InvalidJobError("Template '" + tpl.name + "': " + e.what());
        }
    };

    for (const auto& field : tpl.fields) {
        if (field.name.empty())
            throw InvalidJobError("Template '" + tpl.name + "' has a field without a name");
        check("field '" + field.name + "'",
              Extract::Engine::ExtractionEngine::effective_selector(field, field.selector));
        for (const auto& fallback : field.fallbacks)
            check("field '" + field.name + "'",
                  Extract::Engine::ExtractionEngine::effective_selector(field, fallback));
    }

    const auto& pagination = tpl.pagination;
    if (pagination.strategy == PaginationStrategy::NextLink)
        check("pagination", pagination.next_selector);
    if (pagination.strategy == PaginationStrategy::PageParameter
        && pagination.url_pattern.find("{page}") == std::string::npos)
        throw InvalidJobError("Template '" + tpl.name + "': url_pattern needs a {page} placeholder");
    if (!pagination.stop_selector.empty())
        check("stop_selector", pagination.stop_selector);
    if (tpl.discovery)
        check("discovery", tpl.discovery->link_selector);
}

JobId JobOrchestrator::submit(JobRequest request) {
    validate(request);

    auto job        = std::make_shared<JobState>();
    job->id         = boost::uuids::to_string(boost::uuids::random_generator()());
    job->request    = std::move(request);
    job->created_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_shutdown_)
            throw InvalidJobError("Orchestrator is shut down");
        jobs_[job->id] = job;
        order_.push_back(job->id);
        job->status = JobStatus::Queued;
    }

    Logger::info("Job " + job->id + " queued: " + job->request.target_url + " ["
                 + job->request.tpl->name + "]");
    emit_progress(job);
    return job->id;
}

void JobOrchestrator::start(const JobId& id) {
    auto job = find(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->status != JobStatus::Queued || job->start_requested) {
            Logger::warn("Job " + id + " cannot be started from state "
                         + to_string(job->status));
            return;
        }
        job->start_requested = true;
        waiting_.push_back(id);
    }
    pump_queue();
}

void JobOrchestrator::pump_queue() {
    std::vector<std::shared_ptr<JobState>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_shutdown_)
            return;
        while (running_ < config_.max_concurrent_jobs && !waiting_.empty()) {
            auto it = jobs_.find(waiting_.front());
            waiting_.pop_front();
            if (it == jobs_.end() || it->second->status != JobStatus::Queued)
                continue;

            auto& job       = it->second;
            job->status     = JobStatus::Running;
            job->started_at = std::chrono::system_clock::now();
            job->holds_slot = true;
            running_++;
            ready.push_back(job);
        }
    }

    for (auto& job : ready) {
        Logger::info("Job " + job->id + " running");
        emit_progress(job);
        launch(job);
    }
}

void JobOrchestrator::launch(std::shared_ptr<JobState> job) {
    boost::asio::co_spawn(
        boost::asio::make_strand(ioc_), run_job(std::move(job)), boost::asio::detached);
}

void JobOrchestrator::cancel(const JobId& id) {
    auto job     = find(id);
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(job->status) || job->cancel_requested)
            return;
        job->cancel_requested = true;
        running = job->status == JobStatus::Running || job->status == JobStatus::Paused;
        if (!running)
            waiting_.erase(std::remove(waiting_.begin(), waiting_.end(), id), waiting_.end());
    }

    if (!running) {
        finalize(job, JobStatus::Cancelled, "Cancelled before start");
        return;
    }

    Logger::warn("Cancelling job " + id);
    job->cancel.cancel();

    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, config_.cancel_grace);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->grace_timer = timer;
    }
    timer->async_wait([this, job, timer](const boost::system::error_code& ec) {
        if (!ec)
            finalize(job, JobStatus::Cancelled, "Cancellation grace period exceeded");
    });
}

void JobOrchestrator::cancel_all() {
    std::vector<JobId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids = order_;
    }
    for (const auto& id : ids)
        cancel(id);
}

bool JobOrchestrator::pause(const JobId& id) {
    auto job = find(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->status != JobStatus::Running || job->cancel_requested)
            return false;
        job->status = JobStatus::Paused;
    }
    Logger::info("Job " + id + " paused");
    emit_progress(job);
    return true;
}

bool JobOrchestrator::resume(const JobId& id) {
    auto job = find(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->status != JobStatus::Paused || job->cancel_requested)
            return false;
        job->status = JobStatus::Running;
    }
    Logger::info("Job " + id + " resumed");
    emit_progress(job);
    return true;
}

void JobOrchestrator::abort_job(const std::shared_ptr<JobState>& job, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!job->abort_reason.empty())
            return;
        job->abort_reason = reason;
    }
    Logger::error("Job " + job->id + " aborted: " + reason);
    job->cancel.cancel();
}

void JobOrchestrator::finish(const std::shared_ptr<JobState>& job) {
    JobStatus   status = JobStatus::Completed;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->finalized)
            return;

        const auto& fields       = job->request.tpl->fields;
        bool        has_required = std::any_of(
            fields.begin(), fields.end(), [](const auto& f) { return f.required; });

        if (!job->abort_reason.empty()) {
            status = JobStatus::Failed;
            reason = job->abort_reason;
        }
        else if (job->cancel_requested) {
            status = JobStatus::Cancelled;
            reason = "Cancelled";
        }
        else if (has_required && job->pages_attempted > 0
                 && job->pages_missing_required == job->pages_attempted) {
            status = JobStatus::Failed;
            reason = "Required fields missing on every page";
        }
    }
    finalize(job, status, reason);
}

void JobOrchestrator::finalize(const std::shared_ptr<JobState>& job,
                               JobStatus                        status,
                               const std::string&               reason) {
    {
        std::lock_guard<std::mutex> sink_lock(sink_mutex_);

        JobSnapshot             snapshot;
        std::vector<PageResult> pages;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (job->finalized)
                return;
            job->finalized       = true;
            job->status          = status;
            job->ended_at        = std::chrono::system_clock::now();
            job->terminal_reason = reason;
            if (status == JobStatus::Failed && !reason.empty()
                && std::find(job->errors.begin(), job->errors.end(), reason) == job->errors.end())
                job->errors.push_back(reason);
            if (job->holds_slot) {
                job->holds_slot = false;
                running_--;
            }
            snapshot = make_snapshot(*job);
            pages    = flatten(*job);
        }

        std::string summary = "Job " + job->id + " " + to_string(status) + " ("
                              + std::to_string(snapshot.progress.pages_fetched) + " pages, "
                              + std::to_string(snapshot.progress.items_extracted) + " items, "
                              + std::to_string(snapshot.progress.items_failed) + " failed)";
        if (status == JobStatus::Completed)
            Logger::success(summary);
        else if (status == JobStatus::Failed)
            Logger::error(summary + ": " + reason);
        else
            Logger::warn(summary);

        try {
            if (progress_sink_)
                progress_sink_->on_progress(ProgressEvent{job->id, snapshot.progress});
            if (result_sink_)
                result_sink_->on_job_finished(snapshot, pages);
        } catch (const std::exception& e) {
            Logger::error("Sink failed for job " + job->id + ": " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            job->settled = true;
        }
    }
    done_cv_.notify_all();
    pump_queue();
}

void JobOrchestrator::emit_progress(const std::shared_ptr<JobState>& job) {
    if (!progress_sink_)
        return;

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    ProgressEvent               event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->finalized)
            return;
        event = ProgressEvent{job->id, make_snapshot(*job).progress};
    }
    try {
        progress_sink_->on_progress(event);
    } catch (const std::exception& e) {
        Logger::error("Progress sink failed for job " + job->id + ": " + e.what());
    }
}

std::shared_ptr<JobOrchestrator::JobState> JobOrchestrator::find(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(id);
    if (it == jobs_.end())
        throw InvalidJobError("Unknown job: " + id);
    return it->second;
}

JobSnapshot JobOrchestrator::make_snapshot(const JobState& job) const {
    JobSnapshot snapshot;
    snapshot.id              = job.id;
    snapshot.name            = job.request.name;
    snapshot.target_url      = job.request.target_url;
    snapshot.template_name   = job.request.tpl->name;
    snapshot.progress        = job.progress;
    snapshot.progress.status = job.status;
    snapshot.created_at      = job.created_at;
    snapshot.started_at      = job.started_at;
    snapshot.ended_at        = job.ended_at;
    snapshot.errors          = job.errors;
    snapshot.terminal_reason = job.terminal_reason;

    auto& progress = snapshot.progress;
    if (job.status == JobStatus::Completed) {
        progress.percent = 1.0;
    }
    else if (progress.estimated_total > 0) {
        progress.percent = std::min(1.0,
                                    static_cast<double>(progress.pages_fetched)
                                        / static_cast<double>(progress.estimated_total));
    }
    return snapshot;
}

std::vector<PageResult> JobOrchestrator::flatten(const JobState& job) {
    std::vector<PageResult> pages;
    for (const auto& chain : job.chains)
        pages.insert(pages.end(), chain.begin(), chain.end());
    return pages;
}

JobStatus JobOrchestrator::status(const JobId& id) const {
    auto                        job = find(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return job->status;
}

Progress JobOrchestrator::progress(const JobId& id) const {
    auto                        job = find(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return make_snapshot(*job).progress;
}

std::vector<std::string> JobOrchestrator::errors(const JobId& id) const {
    auto                        job = find(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return job->errors;
}

std::vector<PageResult> JobOrchestrator::results(const JobId& id) const {
    auto                        job = find(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return flatten(*job);
}

JobSnapshot JobOrchestrator::snapshot(const JobId& id) const {
    auto                        job = find(id);
    std::lock_guard<std::mutex> lock(mutex_);
    return make_snapshot(*job);
}

std::vector<JobId> JobOrchestrator::jobs(std::optional<JobStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!status)
        return order_;

    std::vector<JobId> out;
    for (const auto& id : order_) {
        if (jobs_.at(id)->status == *status)
            out.push_back(id);
    }
    return out;
}

bool JobOrchestrator::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(id);
    if (it == jobs_.end())
        throw InvalidJobError("Unknown job: " + id);
    if (!is_terminal(it->second->status) || !it->second->settled) {
        Logger::warn("Job " + id + " is " + to_string(it->second->status) + ", not removed");
        return false;
    }

    jobs_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    Logger::debug("Job " + id + " removed");
    return true;
}

JobStatus JobOrchestrator::wait(const JobId& id) {
    auto                         job = find(id);
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [&job] { return job->settled; });
    return job->status;
}

bool JobOrchestrator::wait_for(const JobId& id, std::chrono::milliseconds timeout) {
    auto                         job = find(id);
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [&job] { return job->settled; });
}

void JobOrchestrator::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    std::vector<std::shared_ptr<JobState>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, job] : jobs_) {
            if (!job->finalized)
                live.push_back(job);
        }
        waiting_.clear();
    }
    for (auto& job : live) {
        job->cancel.cancel();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            job->cancel_requested = true;
        }
        finalize(job, JobStatus::Cancelled, "Orchestrator shut down");
    }

    work_guard_.reset();
    ioc_.stop();
    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();
    Logger::debug("Orchestrator shut down.");
}

}  // namespace Engine
}  // namespace Gleaner
