#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include "../../core/sync/cancel_token.hpp"
#include "../../core/types/constants.hpp"
#include "../../core/types/fetch_outcome.hpp"
#include "../../network/http/fetcher.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../defense/defense_detector.hpp"

namespace Gleaner {
namespace Fetch {
namespace Pipeline {

struct PipelineOptions {
    int                       max_retries     = Core::Constants::MAX_RETRIES;
    int                       defense_retries = Core::Constants::DEFENSE_RETRIES;
    std::chrono::milliseconds backoff_base{Core::Constants::BACKOFF_BASE_MS};
    std::chrono::milliseconds backoff_cap{Core::Constants::BACKOFF_CAP_MS};
    std::chrono::milliseconds proxy_wait{Core::Constants::PROXY_WAIT_MS};
};

struct FetchAttempt {
    std::string                                      url;
    std::string                                      proxy;  // empty for direct fetches
    Core::FetchOutcome                               outcome = Core::FetchOutcome::Success;
    std::chrono::milliseconds                        latency{0};
    int                                              attempt = 0;  // 1-based, counts every request
    std::shared_ptr<const Network::Http::RawDocument> response;
};

// Maps a raw backend result onto an attempt outcome.
Core::FetchOutcome classify(const Network::Http::RawDocument&   doc,
                            const Defense::DefenseDetector& detector);

// 408, 425, 429 and every 5xx are worth retrying; other 4xx are final.
bool is_transient_status(long status);

/**
 * @brief Fetches one page with retries, proxy rotation and defense handling.
 *
 * Each request is reported to the pool. Connection-level failures (timeout,
 * refused) switch proxy before the next try; other transient failures retry
 * on the same proxy after an exponential backoff. A defense response always
 * moves to a proxy that has not been blocked for this page yet.
 */
class FetchPipeline {
public:
    FetchPipeline(Proxy::Pool::ProxyPool&         pool,
                  Network::Http::Fetcher&         fetcher,
                  const Defense::DefenseDetector& detector,
                  PipelineOptions                 options = {});

    /**
     * @return The final successful attempt, or an attempt with outcome
     * Cancelled when @p cancel fired.
     * @throws Core::FetchExhaustedError after max_retries transient failures
     * or on a non-transient HTTP status.
     * @throws Core::DefenseDetectedError after defense_retries blocked attempts,
     * or when no unblocked proxy is left to rotate to.
     * @throws Core::NoProxyAvailableError when no proxy comes back within proxy_wait.
     */
    boost::asio::awaitable<FetchAttempt> fetch(const std::string&                  url,
                                               const Network::Http::FetchProfile& profile,
                                               const Core::CancelToken&           cancel);

    /**
     * @brief Sends one request to @p test_url through every pooled proxy and
     * reports the result to the pool.
     * @return Proxy address -> whether it answered with a 2xx/3xx page.
     */
    boost::asio::awaitable<std::map<std::string, bool>> validate_proxies(
        const std::string&                 test_url,
        const Network::Http::FetchProfile& profile,
        const Core::CancelToken&           cancel);

    const PipelineOptions& options() const {
        return options_;
    }

private:
    boost::asio::awaitable<std::optional<Proxy::Pool::ProxyEntry>> acquire_proxy(
        const std::string&       domain,
        const std::set<size_t>&  exclude,
        const Core::CancelToken& cancel);

    std::chrono::milliseconds draw_delay(const Network::Http::FetchProfile& profile);

    Proxy::Pool::ProxyPool&         pool_;
    Network::Http::Fetcher&         fetcher_;
    const Defense::DefenseDetector& detector_;
    PipelineOptions                 options_;
};

}  // namespace Pipeline
}  // namespace Fetch
}  // namespace Gleaner
