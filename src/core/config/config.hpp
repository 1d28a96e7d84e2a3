#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Gleaner {
namespace Core {

struct Config {
    // Runtime
    int threads         = Constants::DEFAULT_IO_THREADS;
    int max_jobs        = Constants::DEFAULT_MAX_JOBS;
    int job_concurrency = Constants::DEFAULT_JOB_CONCURRENCY;

    std::string              template_path;
    std::vector<std::string> urls;
    std::string              output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string              config_path;
    std::string              log_level = "info";

    // Proxy pool
    std::vector<std::string> proxies;
    std::string              proxy_policy          = "performance";
    int                      failure_threshold     = Constants::PROXY_FAILURE_THRESHOLD;
    int                      cooldown_ms           = Constants::PROXY_COOLDOWN_MS;
    int                      blacklist_after_trips = Constants::PROXY_BLACKLIST_TRIPS;
    int                      max_blacklist_ms      = Constants::PROXY_MAX_BLACKLIST_MS;
    int                      domain_reuse_ms       = Constants::PROXY_DOMAIN_REUSE_MS;
    int                      proxy_wait_ms         = Constants::PROXY_WAIT_MS;
    std::string              validate_url;  // every proxy fetches this once before the jobs start

    // Fetch pipeline
    int max_retries              = Constants::MAX_RETRIES;
    int backoff_base_ms          = Constants::BACKOFF_BASE_MS;
    int backoff_cap_ms           = Constants::BACKOFF_CAP_MS;
    int defense_retries          = Constants::DEFENSE_RETRIES;
    int max_consecutive_failures = Constants::MAX_CONSECUTIVE_FAILURES;
    int cancel_grace_ms          = Constants::CANCEL_GRACE_MS;
    int connect_timeout_ms       = Constants::CONNECT_TIMEOUT_MS;

    std::vector<std::string> defense_markers;  // empty = built-in list

    // Backends
    std::string fetcher = "beast";  // beast | curl | browser
    std::string browser_path;
    int         cdp_port = Constants::DEFAULT_CDP_PORT;
    bool        headless = true;

    static Config parse(int argc, char* argv[]);

    // Applies the keys present in a YAML file on top of @p config.
    static void load_yaml(Config& config, const std::string& path);

    // One proxy per line; blank lines and '#' comments are skipped.
    static std::vector<std::string> load_proxy_list(const std::string& path);

    // Range checks shared by the YAML and command line paths.
    void validate() const;
};

}  // namespace Core
}  // namespace Gleaner
