#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace Gleaner {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_IO_THREADS      = 2;
    static constexpr int         DEFAULT_MAX_JOBS        = 3;
    static constexpr int         DEFAULT_JOB_CONCURRENCY = 4;
    static constexpr const char* DEFAULT_OUTPUT_DIR      = "results";
    static constexpr const char* VERSION                 = "0.1.0";
    static constexpr const char* USER_AGENT              = "Gleaner/0.1";

    static constexpr int MAX_RETRIES               = 3;
    static constexpr int DEFENSE_RETRIES           = 2;
    static constexpr int MAX_CONSECUTIVE_FAILURES  = 5;
    static constexpr int BACKOFF_BASE_MS           = 500;
    static constexpr int BACKOFF_CAP_MS            = 30000;
    static constexpr int REQUEST_TIMEOUT_SECONDS   = 30;
    static constexpr int CONNECT_TIMEOUT_MS        = 5000;
    static constexpr int MAX_REDIRECTS             = 5;
    static constexpr int CANCEL_GRACE_MS           = 5000;
    static constexpr int DEFAULT_MAX_PAGES         = 10;
    static constexpr int DEFAULT_DUPLICATE_WINDOW  = 3;
    static constexpr int DEFAULT_CDP_PORT          = 9222;
    static constexpr int POLL_INTERVAL_MS          = 50;

    static constexpr int    PROXY_FAILURE_THRESHOLD   = 5;
    static constexpr int    PROXY_COOLDOWN_MS         = 60000;
    static constexpr int    PROXY_BLACKLIST_TRIPS     = 3;
    static constexpr int    PROXY_MAX_BLACKLIST_MS    = 300000;
    static constexpr int    PROXY_DOMAIN_REUSE_MS     = 2000;
    static constexpr int    PROXY_WAIT_MS             = 3000;
    static constexpr double PROXY_DEFAULT_LATENCY_MS  = 1000.0;
    static constexpr double PROXY_SCORE_DECAY         = 0.3;
    static constexpr size_t PROXY_LATENCY_WINDOW      = 10;
};

inline const std::vector<std::string>& get_browser_user_agents() {
    static const std::vector<std::string> agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like "
        "Gecko) Version/17.4 Safari/605.1.15",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/123.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:125.0) Gecko/20100101 Firefox/125.0",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0.0.0 Safari/537.36"};
    return agents;
}

inline const std::vector<std::string>& get_default_defense_markers() {
    static const std::vector<std::string> markers = {"g-recaptcha",
                                                     "recaptcha/api",
                                                     "h-captcha",
                                                     "hcaptcha.com",
                                                     "captcha-container",
                                                     "challenge-form",
                                                     "cf-challenge",
                                                     "cf_chl_opt",
                                                     "challenges.cloudflare.com",
                                                     "captcha-image",
                                                     "are you a robot",
                                                     "verify you are human",
                                                     "unusual traffic from your computer",
                                                     "access denied"};
    return markers;
}

inline const std::vector<std::string>& get_challenge_headers() {
    static const std::vector<std::string> headers = {
        "cf-ray", "cf-mitigated", "x-sucuri-id", "x-sucuri-cache", "x-datadome"};
    return headers;
}

// base * 2^attempt, capped. Attempt 0 is the first retry.
inline std::chrono::milliseconds get_backoff_time(int                       attempt,
                                                  std::chrono::milliseconds base,
                                                  std::chrono::milliseconds cap) {
    if (attempt < 0 || base.count() <= 0)
        return std::chrono::milliseconds(0);
    int  shift  = std::min(attempt, 30);
    auto scaled = base.count() * (static_cast<long long>(1) << shift);
    return std::chrono::milliseconds(std::min<long long>(scaled, cap.count()));
}

}  // namespace Core
}  // namespace Gleaner
