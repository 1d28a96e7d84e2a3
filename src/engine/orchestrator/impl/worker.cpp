#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <set>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../pagination/pagination_controller.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../../../utils/url/url.hpp"
#include "../orchestrator.hpp"

namespace Gleaner {
namespace Engine {

namespace net = boost::asio;

using namespace Gleaner::Core;
using Pagination::PaginationController;
using Pagination::StopReason;

net::awaitable<void> JobOrchestrator::run_job(std::shared_ptr<JobState> job) {
    try {
        auto seeds = co_await discover_seeds(job);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int max_pages = job->request.tpl->pagination.max_pages;
            job->chains.resize(seeds.size());
            job->progress.estimated_total =
                max_pages > 0 ? static_cast<size_t>(max_pages) * seeds.size() : 0;
        }
        job->seeds     = std::move(seeds);
        job->next_seed = 0;

        auto   executor = co_await net::this_coro::executor;
        size_t workers  = std::min(static_cast<size_t>(std::max(1, config_.job_fetch_concurrency)),
                                  job->seeds.size());
        job->chains_done =
            std::make_shared<net::steady_timer>(executor, net::steady_timer::time_point::max());
        for (size_t i = 0; i < workers; ++i) {
            job->active_chains++;
            net::co_spawn(executor, chain_worker(job), net::detached);
        }

        // The last chain cancels the timer; nothing else touches it.
        while (job->active_chains > 0) {
            boost::system::error_code ec;
            co_await job->chains_done->async_wait(net::redirect_error(net::use_awaitable, ec));
        }

        // A pause that lands while the last page is in flight holds the job
        // until it is resumed or cancelled.
        if (!co_await wait_while_paused(job))
            Logger::debug("Job " + job->id + " stopped while paused");
    } catch (const Core::Error& e) {
        abort_job(job, std::string(to_string(e.kind())) + ": " + e.what());
    } catch (const std::exception& e) {
        abort_job(job, e.what());
    }
    finish(job);
}

net::awaitable<void> JobOrchestrator::chain_worker(std::shared_ptr<JobState> job) {
    while (job->next_seed < job->seeds.size() && !job->cancel.cancelled()) {
        size_t seed = job->next_seed++;
        try {
            co_await run_chain(job, seed, job->seeds[seed]);
        } catch (const Core::Error& e) {
            abort_job(job, std::string(to_string(e.kind())) + ": " + e.what());
        } catch (const std::exception& e) {
            abort_job(job, e.what());
        }
    }
    if (--job->active_chains == 0 && job->chains_done)
        job->chains_done->cancel();
}

net::awaitable<std::vector<std::string>> JobOrchestrator::discover_seeds(
    const std::shared_ptr<JobState>& job) {
    const auto&        tpl   = *job->request.tpl;
    const std::string& start = job->request.target_url;
    if (!tpl.discovery)
        co_return std::vector<std::string>{start};

    auto attempt = co_await pipeline_.fetch(start, tpl.profile, job->cancel);
    if (attempt.outcome == FetchOutcome::Cancelled)
        co_return std::vector<std::string>{};

    auto        document = parser_.parse(attempt.response->body);
    std::string selector = tpl.discovery->link_selector;
    if (selector.find("::") == std::string::npos)
        selector += "::attr(href)";

    std::vector<std::string> seeds;
    std::set<std::string>    seen;
    for (const auto& link : document->select(selector)) {
        std::string url = Utils::Url::resolve(attempt.response->base_url(), Utils::Text::trim(link));
        if (!Utils::Url::is_http_url(url))
            continue;
        if (tpl.discovery->same_domain && !Utils::Url::is_same_domain(url, start))
            continue;
        if (!seen.insert(Utils::Url::normalize(url)).second)
            continue;
        seeds.push_back(url);
        if (tpl.discovery->max_seeds > 0 && seeds.size() >= tpl.discovery->max_seeds)
            break;
    }

    if (seeds.empty()) {
        Logger::warn("Job " + job->id + ": discovery found no links, scraping the start page");
        seeds.push_back(start);
    }
    else {
        Logger::info("Job " + job->id + ": discovered " + std::to_string(seeds.size()) + " seed(s)");
    }
    co_return seeds;
}

net::awaitable<bool> JobOrchestrator::wait_while_paused(const std::shared_ptr<JobState>& job) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (job->status != JobStatus::Paused)
                break;
        }
        if (!co_await Core::sleep_for(std::chrono::milliseconds(Constants::POLL_INTERVAL_MS),
                                      job->cancel))
            co_return false;
    }
    co_return !job->cancel.cancelled();
}

net::awaitable<void> JobOrchestrator::run_chain(std::shared_ptr<JobState> job,
                                                size_t                    seed,
                                                std::string               url) {
    PaginationController pager(job->request.tpl->pagination);
    int                  pages = 0;

    while (!url.empty()) {
        if (!co_await wait_while_paused(job))
            break;

        auto outcome = co_await process_page(job, seed, pages + 1, url);
        if (!outcome)
            break;
        pages++;

        auto next = pager.next_url(outcome->page, outcome->document.get(), pages);
        if (!next) {
            Logger::debug("Job " + job->id + ": chain " + std::to_string(seed) + " stops after "
                          + std::to_string(pages) + " page(s) ("
                          + Pagination::to_string(pager.stop_reason()) + ")");
        }
        outcome->page.next_url = next.value_or("");
        outcome->page.document.reset();

        int failures = record_page(job, std::move(outcome->page));
        if (failures >= config_.max_consecutive_failures) {
            throw JobAbortedError(std::to_string(failures) + " consecutive page failures");
        }
        url = next.value_or("");
    }
}

net::awaitable<std::optional<JobOrchestrator::PageOutcome>> JobOrchestrator::process_page(
    const std::shared_ptr<JobState>& job,
    size_t                           seed,
    int                              page_number,
    const std::string&               url) {
    const auto& tpl = *job->request.tpl;

    PageOutcome out;
    PageResult& page = out.page;
    page.url         = url;
    page.seed        = seed;
    page.page_number = page_number;

    Logger::info("Job " + job->id + ": fetching " + url + " (page " + std::to_string(page_number)
                 + ")");

    try {
        auto attempt = co_await pipeline_.fetch(url, tpl.profile, job->cancel);
        if (attempt.outcome == FetchOutcome::Cancelled)
            co_return std::nullopt;

        const auto& raw  = *attempt.response;
        page.attempts    = attempt.attempt;
        page.proxy       = attempt.proxy;
        page.latency     = attempt.latency;
        page.status_code = raw.status_code;
        page.document    = attempt.response;

        out.document    = parser_.parse(raw.body);
        auto extraction = engine_.extract(*out.document, tpl, raw.base_url());

        page.record       = std::move(extraction.record);
        page.field_errors = std::move(extraction.field_errors);
        page.coverage     = extraction.coverage;
        page.partial      = extraction.partial;
        page.success      = !extraction.failed;

        if (extraction.failed) {
            std::vector<std::string> missing;
            for (const auto& err : page.field_errors) {
                if (err.required)
                    missing.push_back(err.field);
            }
            page.error = PageError{to_string(ErrorKind::ExtractionField),
                                   "Required field(s) missing: " + Utils::Text::join(missing, ", ")};
        }
    } catch (const NoProxyAvailableError&) {
        throw;
    } catch (const Core::Error& e) {
        page.success = false;
        page.error   = PageError{to_string(e.kind()), e.what()};
        Logger::warn("Job " + job->id + ": page failed " + url + ": " + e.what());
    }

    co_return std::move(out);
}

int JobOrchestrator::record_page(const std::shared_ptr<JobState>& job, PageResult page) {
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job->finalized) {
            Logger::debug("Job " + job->id + ": discarding late page " + page.url);
            return 0;
        }

        job->pages_attempted++;
        job->progress.pages_fetched++;
        if (page.partial)
            job->pages_missing_required++;

        if (page.success) {
            job->consecutive_failures = 0;
            if (!page.record.empty())
                job->progress.items_extracted++;
        }
        else {
            job->consecutive_failures++;
            job->progress.items_failed++;
        }

        if (page.error) {
            job->errors.push_back(page.url + ": " + page.error->message);
        }
        else {
            for (const auto& err : page.field_errors) {
                if (err.required)
                    job->errors.push_back(page.url + ": field '" + err.field + "': " + err.message);
            }
        }

        failures = job->consecutive_failures;
        job->chains[page.seed].push_back(std::move(page));
    }
    emit_progress(job);
    return failures;
}

}  // namespace Engine
}  // namespace Gleaner
