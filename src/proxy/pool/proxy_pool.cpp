#include "proxy_pool.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Gleaner {
namespace Proxy {
namespace Pool {

using namespace Gleaner::Core;

const char* to_string(ProxyState state) {
    switch (state) {
        case ProxyState::Active: return "active";
        case ProxyState::CoolingDown: return "cooling_down";
        case ProxyState::Blacklisted: return "blacklisted";
    }
    return "unknown";
}

const char* to_string(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::RoundRobin: return "round_robin";
        case SelectionPolicy::Random: return "random";
        case SelectionPolicy::PerformanceWeighted: return "performance";
    }
    return "unknown";
}

SelectionPolicy parse_policy(const std::string& name) {
    if (name == "round_robin" || name == "round-robin")
        return SelectionPolicy::RoundRobin;
    if (name == "random")
        return SelectionPolicy::Random;
    if (name == "performance" || name == "performance_weighted")
        return SelectionPolicy::PerformanceWeighted;
    throw std::invalid_argument("Unknown proxy policy: " + name);
}

double ProxyEntry::average_latency_ms() const {
    if (latencies.empty())
        return Constants::PROXY_DEFAULT_LATENCY_MS;
    auto total = std::accumulate(latencies.begin(), latencies.end(), std::chrono::milliseconds(0));
    return std::max(1.0, static_cast<double>(total.count()) / latencies.size());
}

double ProxyEntry::quality() const {
    return score / average_latency_ms();
}

ProxyPool::ProxyPool(const std::vector<std::string>& proxies, ProxyOptions options)
    : options_(options) {
    size_t id_counter = 0;
    for (const auto& address : proxies) {
        ProxyEntry entry;
        entry.id      = id_counter++;
        entry.address = address;
        entries_.push_back(std::move(entry));
    }
}

void ProxyPool::sweep(Clock::time_point now) {
    for (auto& entry : entries_) {
        if (entry.state != ProxyState::Active && entry.deadline <= now) {
            Logger::info("Proxy back in rotation: " + entry.address + " (was "
                         + to_string(entry.state) + ")");
            entry.state                = ProxyState::Active;
            entry.consecutive_failures = 0;
        }
    }
}

size_t ProxyPool::select(const std::vector<size_t>& candidates) {
    switch (options_.policy) {
        case SelectionPolicy::RoundRobin: {
            // First candidate at or after the cursor, wrapping around.
            size_t chosen = candidates.front();
            for (size_t idx : candidates) {
                if (entries_[idx].id >= cursor_) {
                    chosen = idx;
                    break;
                }
            }
            cursor_ = entries_[chosen].id + 1;
            return chosen;
        }
        case SelectionPolicy::Random: {
            std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
            return candidates[dist(rng_)];
        }
        case SelectionPolicy::PerformanceWeighted:
            break;
    }

    size_t best = candidates.front();
    for (size_t idx : candidates) {
        const auto& cand    = entries_[idx];
        const auto& current = entries_[best];
        double      q1 = cand.quality(), q2 = current.quality();
        if (q1 > q2 * (1.0 + 1e-9))
            best = idx;
        else if (q1 >= q2 * (1.0 - 1e-9) && cand.last_used < current.last_used)
            best = idx;
    }
    return best;
}

ProxyEntry ProxyPool::acquire(const std::string& domain, const std::set<size_t>& exclude) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        now = Clock::now();
    sweep(now);

    std::vector<size_t> active;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].state == ProxyState::Active && !exclude.count(entries_[i].id))
            active.push_back(i);
    }
    if (active.empty()) {
        throw NoProxyAvailableError("No active proxy among " + std::to_string(entries_.size())
                                    + " configured (" + std::to_string(exclude.size())
                                    + " excluded)");
    }

    std::vector<size_t> fresh;
    for (size_t idx : active) {
        auto it = entries_[idx].domain_last_use.find(domain);
        if (it == entries_[idx].domain_last_use.end()
            || now - it->second >= options_.domain_reuse_interval)
            fresh.push_back(idx);
    }

    auto& entry                   = entries_[select(fresh.empty() ? active : fresh)];
    entry.last_used               = now;
    entry.domain_last_use[domain] = now;
    return entry;
}

void ProxyPool::trip(ProxyEntry& entry, Clock::time_point now) {
    entry.trips++;
    entry.consecutive_failures = 0;

    if (entry.trips >= options_.blacklist_after_trips) {
        std::chrono::milliseconds duration = options_.cooldown * (1LL << std::min(entry.trips, 20));
        duration = std::min(duration, options_.max_blacklist);
        entry.state    = ProxyState::Blacklisted;
        entry.deadline = now + duration;
        Logger::error("Proxy blacklisted for " + std::to_string(duration.count())
                      + "ms: " + entry.address);
        return;
    }

    entry.state    = ProxyState::CoolingDown;
    entry.deadline = now + options_.cooldown;
    Logger::warn("Proxy cooling down (" + std::to_string(entry.trips) + "/"
                 + std::to_string(options_.blacklist_after_trips) + "): " + entry.address);
}

void ProxyPool::report(const ProxyEntry&         reported,
                       FetchOutcome              outcome,
                       std::chrono::milliseconds latency) {
    if (outcome == FetchOutcome::Cancelled)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (reported.id >= entries_.size())
        return;

    auto&  entry = entries_[reported.id];
    double decay = Constants::PROXY_SCORE_DECAY;

    if (outcome == FetchOutcome::Success || outcome == FetchOutcome::HttpError) {
        entry.successes++;
        entry.consecutive_failures = 0;
        entry.trips                = 0;
        entry.score                = decay + (1.0 - decay) * entry.score;
        entry.latencies.push_back(latency);
        if (entry.latencies.size() > Constants::PROXY_LATENCY_WINDOW)
            entry.latencies.pop_front();
        return;
    }

    entry.failures++;
    entry.consecutive_failures++;
    entry.score = (1.0 - decay) * entry.score;
    Logger::debug("Proxy failure (" + std::string(to_string(outcome)) + ", "
                  + std::to_string(entry.consecutive_failures) + "/"
                  + std::to_string(options_.failure_threshold) + "): " + entry.address);

    // Reports that arrive after the entry already left rotation only count.
    if (entry.state == ProxyState::Active
        && entry.consecutive_failures >= options_.failure_threshold)
        trip(entry, Clock::now());
}

void ProxyPool::release(const ProxyEntry& entry, const std::string& domain) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.id < entries_.size())
        entries_[entry.id].domain_last_use.erase(domain);
}

PoolStats ProxyPool::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep(Clock::now());

    PoolStats stats;
    long      total = 0, ok = 0;
    for (const auto& entry : entries_) {
        switch (entry.state) {
            case ProxyState::Active: stats.active++; break;
            case ProxyState::CoolingDown: stats.cooling_down++; break;
            case ProxyState::Blacklisted: stats.blacklisted++; break;
        }
        total += entry.successes + entry.failures;
        ok += entry.successes;
    }
    stats.success_rate = total > 0 ? static_cast<double>(ok) / total : 1.0;
    stats.entries      = entries_;
    return stats;
}

bool ProxyPool::add(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.address == address)
            return false;
    }
    ProxyEntry entry;
    entry.id      = entries_.size();
    entry.address = address;
    entries_.push_back(std::move(entry));
    Logger::info("Added proxy to rotation: " + address);
    return true;
}

void ProxyPool::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : entries_) {
        ProxyEntry fresh;
        fresh.id      = entry.id;
        fresh.address = std::move(entry.address);
        entry         = std::move(fresh);
    }
    cursor_ = 0;
    Logger::info("Reset statistics for " + std::to_string(entries_.size()) + " proxies");
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Gleaner
