#include "fetch_pipeline.hpp"
#include <random>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Gleaner {
namespace Fetch {
namespace Pipeline {

namespace net = boost::asio;

using Core::FetchOutcome;
using Core::Logger;
using Network::Http::ErrorType;
using Network::Http::RawDocument;
using Proxy::Pool::ProxyEntry;

FetchOutcome classify(const RawDocument& doc, const Defense::DefenseDetector& detector) {
    switch (doc.error_type) {
        case ErrorType::None: break;
        case ErrorType::Cancelled: return FetchOutcome::Cancelled;
        case ErrorType::Timeout: return FetchOutcome::Timeout;
        case ErrorType::Refused:
        case ErrorType::Proxy: return FetchOutcome::Refused;
        case ErrorType::Network:
        case ErrorType::Dns:
        case ErrorType::Browser:
        case ErrorType::Render: return FetchOutcome::NetworkError;
    }
    if (detector.is_defense_response(doc))
        return FetchOutcome::DefenseDetected;
    if (doc.status_code >= static_cast<long>(Network::Http::MaxCode::ClientError))
        return FetchOutcome::HttpError;
    return FetchOutcome::Success;
}

bool is_transient_status(long status) {
    return status == 408 || status == 425 || status == 429 || status >= 500;
}

FetchPipeline::FetchPipeline(Proxy::Pool::ProxyPool&         pool,
                             Network::Http::Fetcher&         fetcher,
                             const Defense::DefenseDetector& detector,
                             PipelineOptions                 options)
    : pool_(pool), fetcher_(fetcher), detector_(detector), options_(options) {
}

std::chrono::milliseconds FetchPipeline::draw_delay(const Network::Http::FetchProfile& profile) {
    auto low  = profile.min_delay.count();
    auto high = std::max(low, profile.max_delay.count());
    if (high <= 0)
        return std::chrono::milliseconds(0);

    thread_local std::mt19937                rng(std::random_device{}());
    std::uniform_int_distribution<long long> dist(low, high);
    return std::chrono::milliseconds(dist(rng));
}

net::awaitable<std::optional<ProxyEntry>> FetchPipeline::acquire_proxy(
    const std::string&       domain,
    const std::set<size_t>&  exclude,
    const Core::CancelToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + options_.proxy_wait;
    while (true) {
        try {
            co_return pool_.acquire(domain, exclude);
        } catch (const Core::NoProxyAvailableError&) {
            if (std::chrono::steady_clock::now() >= deadline)
                throw;
        }
        if (!co_await Core::sleep_for(std::chrono::milliseconds(Core::Constants::POLL_INTERVAL_MS),
                                      cancel))
            co_return std::nullopt;
    }
}

net::awaitable<FetchAttempt> FetchPipeline::fetch(const std::string&                  url,
                                                  const Network::Http::FetchProfile& profile,
                                                  const Core::CancelToken&           cancel) {
    const std::string domain = Utils::Url::host_of(url);
    const bool        direct = pool_.empty();

    FetchAttempt attempt;
    attempt.url = url;

    std::optional<ProxyEntry> proxy;
    std::set<size_t>          blocked;
    bool                      rotate        = true;
    int                       retries       = 0;
    int                       defense_hits  = 0;
    std::string               last_error;

    auto cancelled = [&]() {
        if (proxy)
            pool_.release(*proxy, domain);
        attempt.outcome = FetchOutcome::Cancelled;
        return attempt;
    };

    while (true) {
        if (cancel.cancelled())
            co_return cancelled();

        if (!direct && rotate) {
            try {
                proxy = co_await acquire_proxy(domain, blocked, cancel);
            } catch (const Core::NoProxyAvailableError&) {
                // Every proxy not yet blocked for this page is out of rotation.
                if (blocked.empty())
                    throw;
                throw Core::DefenseDetectedError(url, defense_hits);
            }
            if (!proxy)
                co_return cancelled();
            rotate = false;
        }

        if (!co_await Core::sleep_for(draw_delay(profile), cancel))
            co_return cancelled();

        attempt.proxy = proxy ? proxy->address : "";
        attempt.attempt++;
        RawDocument fetched = co_await fetcher_.fetch_raw(url, attempt.proxy, profile, cancel);
        auto        raw     = std::make_shared<const RawDocument>(std::move(fetched));

        attempt.outcome  = classify(*raw, detector_);
        attempt.latency  = raw->latency;
        attempt.response = raw;

        if (proxy)
            pool_.report(*proxy, attempt.outcome, raw->latency);

        std::string via = proxy ? " via " + proxy->address : "";

        switch (attempt.outcome) {
            case FetchOutcome::Success: co_return attempt;
            case FetchOutcome::Cancelled: co_return cancelled();

            case FetchOutcome::DefenseDetected: {
                defense_hits++;
                Logger::warn("Defense response (" + std::to_string(raw->status_code) + ") for "
                             + url + via);
                if (defense_hits > options_.defense_retries)
                    throw Core::DefenseDetectedError(url, defense_hits);
                if (proxy) {
                    blocked.insert(proxy->id);
                    if (blocked.size() >= pool_.size())
                        throw Core::DefenseDetectedError(url, defense_hits);
                    rotate = true;
                }
                if (!co_await Core::sleep_for(Core::get_backoff_time(defense_hits - 1,
                                                                     options_.backoff_base,
                                                                     options_.backoff_cap),
                                              cancel))
                    co_return cancelled();
                continue;
            }

            case FetchOutcome::HttpError:
                last_error = "HTTP " + std::to_string(raw->status_code);
                if (!is_transient_status(raw->status_code))
                    throw Core::FetchExhaustedError(url, attempt.attempt, last_error);
                break;

            case FetchOutcome::Timeout:
            case FetchOutcome::Refused:
                last_error = raw->error;
                rotate     = true;
                break;

            case FetchOutcome::NetworkError: last_error = raw->error; break;
        }

        if (retries >= options_.max_retries)
            throw Core::FetchExhaustedError(url, attempt.attempt, last_error);

        auto backoff = Core::get_backoff_time(retries, options_.backoff_base, options_.backoff_cap);
        retries++;
        Logger::debug("Retry " + std::to_string(retries) + "/"
                      + std::to_string(options_.max_retries) + " for " + url + " in "
                      + std::to_string(backoff.count()) + "ms (" + last_error + ")"
                      + (rotate && proxy ? ", rotating proxy" : ""));

        if (!co_await Core::sleep_for(backoff, cancel))
            co_return cancelled();
    }
}

net::awaitable<std::map<std::string, bool>> FetchPipeline::validate_proxies(
    const std::string&                 test_url,
    const Network::Http::FetchProfile& profile,
    const Core::CancelToken&           cancel) {
    std::map<std::string, bool> results;
    for (const auto& entry : pool_.stats().entries) {
        if (cancel.cancelled())
            break;

        RawDocument  raw     = co_await fetcher_.fetch_raw(test_url, entry.address, profile, cancel);
        FetchOutcome outcome = classify(raw, detector_);
        if (outcome == FetchOutcome::Cancelled)
            break;

        bool ok = outcome == FetchOutcome::Success;
        // The test page must load; an error status means the proxy is unusable.
        if (outcome == FetchOutcome::HttpError)
            outcome = FetchOutcome::NetworkError;
        pool_.report(entry, outcome, raw.latency);
        results[entry.address] = ok;

        if (ok)
            Logger::success("Proxy OK (" + std::to_string(raw.latency.count()) + "ms): " + entry.address);
        else
            Logger::warn("Proxy failed validation (" + std::string(Core::to_string(outcome)) + "): "
                         + entry.address);
    }
    co_return results;
}

}  // namespace Pipeline
}  // namespace Fetch
}  // namespace Gleaner
