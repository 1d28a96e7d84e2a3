#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../../core/types/fetch_outcome.hpp"

namespace Gleaner {
namespace Proxy {
namespace Pool {

using Clock = std::chrono::steady_clock;

enum class ProxyState { Active, CoolingDown, Blacklisted };

enum class SelectionPolicy { RoundRobin, Random, PerformanceWeighted };

const char*     to_string(ProxyState state);
const char*     to_string(SelectionPolicy policy);
SelectionPolicy parse_policy(const std::string& name);

struct ProxyOptions {
    SelectionPolicy           policy            = SelectionPolicy::PerformanceWeighted;
    int                       failure_threshold = Core::Constants::PROXY_FAILURE_THRESHOLD;
    std::chrono::milliseconds cooldown{Core::Constants::PROXY_COOLDOWN_MS};
    int                       blacklist_after_trips = Core::Constants::PROXY_BLACKLIST_TRIPS;
    std::chrono::milliseconds max_blacklist{Core::Constants::PROXY_MAX_BLACKLIST_MS};
    std::chrono::milliseconds domain_reuse_interval{Core::Constants::PROXY_DOMAIN_REUSE_MS};
};

struct ProxyEntry {
    size_t      id = 0;
    std::string address;

    int    successes            = 0;
    int    failures             = 0;
    int    consecutive_failures = 0;
    int    trips                = 0;     // cooldowns entered since the last success
    double score                = 1.0;   // recency-weighted success rate

    ProxyState        state = ProxyState::Active;
    Clock::time_point deadline{};
    Clock::time_point last_used{};

    std::deque<std::chrono::milliseconds>    latencies;
    std::map<std::string, Clock::time_point> domain_last_use;

    double average_latency_ms() const;
    double quality() const;
};

struct PoolStats {
    size_t                  active       = 0;
    size_t                  cooling_down = 0;
    size_t                  blacklisted  = 0;
    double                  success_rate = 1.0;
    std::vector<ProxyEntry> entries;
};

/**
 * @brief Health-tracking proxy pool shared by every job.
 *
 * Entries are never removed: failing ones cool down and come back. All
 * operations lock a single mutex, so the pool can be used from any thread.
 */
class ProxyPool {
public:
    explicit ProxyPool(const std::vector<std::string>& proxies, ProxyOptions options = {});

    /**
     * @brief Picks an active proxy for a request to @p domain, skipping the
     * ids in @p exclude.
     * @throws Core::NoProxyAvailableError when every entry is cooling down or blacklisted.
     * @return A snapshot of the selected entry; hand it back to report().
     */
    ProxyEntry acquire(const std::string& domain, const std::set<size_t>& exclude = {});

    void report(const ProxyEntry& entry, Core::FetchOutcome outcome, std::chrono::milliseconds latency);

    // Forgets that @p entry was recently used for @p domain.
    void release(const ProxyEntry& entry, const std::string& domain);

    PoolStats stats();

    // Adds @p address to the rotation; false when it is already pooled.
    bool add(const std::string& address);

    // Returns every entry to a fresh, active state.
    void reset_stats();

    bool   empty() const;
    size_t size() const;

    const ProxyOptions& options() const {
        return options_;
    }

private:
    void sweep(Clock::time_point now);
    void trip(ProxyEntry& entry, Clock::time_point now);
    size_t select(const std::vector<size_t>& candidates);

    ProxyOptions            options_;
    std::vector<ProxyEntry> entries_;
    size_t                  cursor_ = 0;
    std::mt19937            rng_{std::random_device{}()};
    mutable std::mutex      mutex_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Gleaner
