#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <yaml-cpp/yaml.h>
#include "../errors/errors.hpp"
#include "../logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Gleaner {
namespace Core {

namespace {

template <typename T>
void read_key(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

std::vector<std::string> read_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node)
            out.push_back(item.as<std::string>());
    }
    else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

}  // namespace

void Config::load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (!yaml.IsMap() && !yaml.IsNull())
            throw ConfigError("Config file must be a mapping: " + path);

        read_key(yaml, "threads", config.threads);
        read_key(yaml, "max_jobs", config.max_jobs);
        read_key(yaml, "job_concurrency", config.job_concurrency);
        read_key(yaml, "template", config.template_path);
        read_key(yaml, "output", config.output_dir);
        read_key(yaml, "output_dir", config.output_dir);
        read_key(yaml, "log_level", config.log_level);

        read_key(yaml, "proxy_policy", config.proxy_policy);
        read_key(yaml, "failure_threshold", config.failure_threshold);
        read_key(yaml, "cooldown_ms", config.cooldown_ms);
        read_key(yaml, "blacklist_after_trips", config.blacklist_after_trips);
        read_key(yaml, "max_blacklist_ms", config.max_blacklist_ms);
        read_key(yaml, "domain_reuse_ms", config.domain_reuse_ms);
        read_key(yaml, "proxy_wait_ms", config.proxy_wait_ms);
        read_key(yaml, "validate_proxies", config.validate_url);

        read_key(yaml, "max_retries", config.max_retries);
        read_key(yaml, "backoff_base_ms", config.backoff_base_ms);
        read_key(yaml, "backoff_cap_ms", config.backoff_cap_ms);
        read_key(yaml, "defense_retries", config.defense_retries);
        read_key(yaml, "max_consecutive_failures", config.max_consecutive_failures);
        read_key(yaml, "cancel_grace_ms", config.cancel_grace_ms);
        read_key(yaml, "connect_timeout_ms", config.connect_timeout_ms);

        read_key(yaml, "fetcher", config.fetcher);
        read_key(yaml, "browser_path", config.browser_path);
        read_key(yaml, "cdp_port", config.cdp_port);
        read_key(yaml, "headless", config.headless);

        if (yaml["urls"]) {
            for (auto& url : read_list(yaml["urls"]))
                config.urls.push_back(url);
        }
        if (yaml["proxies"]) {
            for (auto& proxy : read_list(yaml["proxies"]))
                config.proxies.push_back(proxy);
        }
        if (yaml["proxy_list"]) {
            for (auto& proxy : load_proxy_list(yaml["proxy_list"].as<std::string>()))
                config.proxies.push_back(proxy);
        }
        if (yaml["defense_markers"])
            config.defense_markers = read_list(yaml["defense_markers"]);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file " + path + ": " + std::string(e.what()));
    }
}

std::vector<std::string> Config::load_proxy_list(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Cannot open proxy list: " + path);

    std::vector<std::string> proxies;
    std::string              line;
    while (std::getline(file, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);

        size_t first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            continue;
        size_t last = line.find_last_not_of(" \t\r\n");
        proxies.push_back(line.substr(first, last - first + 1));
    }
    return proxies;
}

void Config::validate() const {
    auto positive = [](int value, const char* name) {
        if (value <= 0)
            throw ConfigError(std::string(name) + " must be positive");
    };
    auto non_negative = [](int value, const char* name) {
        if (value < 0)
            throw ConfigError(std::string(name) + " must not be negative");
    };

    positive(threads, "threads");
    positive(max_jobs, "max_jobs");
    positive(job_concurrency, "job_concurrency");
    positive(failure_threshold, "failure_threshold");
    positive(blacklist_after_trips, "blacklist_after_trips");
    positive(max_consecutive_failures, "max_consecutive_failures");
    positive(connect_timeout_ms, "connect_timeout_ms");
    non_negative(cooldown_ms, "cooldown_ms");
    non_negative(max_blacklist_ms, "max_blacklist_ms");
    non_negative(domain_reuse_ms, "domain_reuse_ms");
    non_negative(proxy_wait_ms, "proxy_wait_ms");
    non_negative(max_retries, "max_retries");
    non_negative(defense_retries, "defense_retries");
    non_negative(backoff_base_ms, "backoff_base_ms");
    non_negative(cancel_grace_ms, "cancel_grace_ms");

    if (backoff_cap_ms < backoff_base_ms)
        throw ConfigError("backoff_cap_ms must be >= backoff_base_ms");
    try {
        Logger::parse_level(log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    if (!validate_url.empty() && !Utils::Url::is_http_url(validate_url))
        throw ConfigError("validate_proxies must be an http(s) URL: " + validate_url);
    if (fetcher != "beast" && fetcher != "curl" && fetcher != "browser")
        throw ConfigError("Unknown fetcher '" + fetcher + "' (expected beast, curl or browser)");
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Gleaner - resilient template-driven web scraper"};

    std::string proxy_list_path;
    std::string single_proxy;

    app.add_option("-t,--template", config.template_path, "Path to the JSON scraping template");
    app.add_option("-o,--output", config.output_dir, "Output directory for job results");
    app.add_option("--threads", config.threads, "I/O threads");
    app.add_option("-j,--max-jobs", config.max_jobs, "Jobs running at the same time");
    app.add_option("--job-concurrency", config.job_concurrency, "Page chains per job");
    app.add_option("-p,--proxy", single_proxy, "Single proxy URL");
    app.add_option("--proxy-list", proxy_list_path, "File containing list of proxies");
    app.add_option("--proxy-policy", config.proxy_policy, "round_robin, random or performance");
    app.add_option("--failure-threshold", config.failure_threshold, "Consecutive failures before cooldown");
    app.add_option("--cooldown-ms", config.cooldown_ms, "Proxy cooldown");
    app.add_option("--proxy-wait-ms", config.proxy_wait_ms, "How long to wait for a proxy");
    app.add_option("--validate-proxies", config.validate_url, "Test every proxy against this URL first");
    app.add_option("--max-retries", config.max_retries, "Retries per page");
    app.add_option("--defense-retries", config.defense_retries, "Proxy rotations on a blocked page");
    app.add_option("--max-failures", config.max_consecutive_failures, "Consecutive page failures before a job fails");
    app.add_option("--connect-timeout-ms", config.connect_timeout_ms, "Connect timeout");
    app.add_option("--fetcher", config.fetcher, "beast, curl or browser");
    app.add_option("--browser", config.browser_path, "Path to Chromium/Chrome executable");
    app.add_option("--cdp-port", config.cdp_port, "Chrome DevTools Protocol port");
    app.add_option("--log-level", config.log_level, "debug, info, warn, error or none");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag(
        "--no-headless",
        [&](size_t count) {
            if (count > 0)
                config.headless = false;
        },
        "Run browser in windowed mode (debug only)");

    app.add_option("urls", config.urls, "Start URLs, one job each");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Command line wins over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!single_proxy.empty())
        config.proxies.push_back(single_proxy);
    if (!proxy_list_path.empty()) {
        for (auto& proxy : load_proxy_list(proxy_list_path))
            config.proxies.push_back(proxy);
    }

    // Bare host:port entries are HTTP proxies.
    for (auto& proxy : config.proxies) {
        if (proxy.find("://") == std::string::npos)
            proxy = "http://" + proxy;
    }

    config.validate();
    return config;
}

}  // namespace Core
}  // namespace Gleaner
