#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <thread>
#include "browser/browser_fetcher.hpp"
#include "browser/launcher/browser_launcher.hpp"
#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "engine/orchestrator/orchestrator.hpp"
#include "extract/query/gumbo_query.hpp"
#include "fetch/defense/defense_detector.hpp"
#include "fetch/pipeline/fetch_pipeline.hpp"
#include "network/http/beast_fetcher.hpp"
#include "network/http/curl_fetcher.hpp"
#include "proxy/pool/proxy_pool.hpp"
#include "sink/json_result_sink.hpp"
#include "sink/log_progress_sink.hpp"
#include "template/loader/template_loader.hpp"

using namespace Gleaner;
using Core::Logger;

namespace {

constexpr int EXIT_JOB_FAILED = 2;
constexpr int EXIT_CANCELLED  = 130;

void launch_browser_if_needed(const Core::Config& config) {
    if (config.fetcher != "browser")
        return;

    std::string path = config.browser_path;
    if (path.empty())
        path = Browser::Launcher::BrowserLauncher::find_browser();

    if (path.empty())
        throw Core::ConfigError("No Chromium browser found. Use --browser to specify path.");
    if (!Browser::Launcher::BrowserLauncher::launch(path, config.cdp_port, config.headless))
        throw Core::ConfigError("Failed to launch browser: " + path);

    std::atexit(Browser::Launcher::BrowserLauncher::cleanup);
}

Proxy::Pool::ProxyOptions proxy_options(const Core::Config& config) {
    Proxy::Pool::ProxyOptions options;
    try {
        options.policy = Proxy::Pool::parse_policy(config.proxy_policy);
    } catch (const std::invalid_argument& e) {
        throw Core::ConfigError(e.what());
    }
    options.failure_threshold     = config.failure_threshold;
    options.cooldown              = std::chrono::milliseconds(config.cooldown_ms);
    options.blacklist_after_trips = config.blacklist_after_trips;
    options.max_blacklist         = std::chrono::milliseconds(config.max_blacklist_ms);
    options.domain_reuse_interval = std::chrono::milliseconds(config.domain_reuse_ms);
    return options;
}

void validate_proxies(Fetch::Pipeline::FetchPipeline& pipeline, const Core::Config& config) {
    Network::Http::FetchProfile profile;
    profile.timeout = std::chrono::milliseconds(config.connect_timeout_ms * 2);

    Core::CancelToken       cancel;
    boost::asio::io_context ioc;
    auto future = boost::asio::co_spawn(
        ioc, pipeline.validate_proxies(config.validate_url, profile, cancel), boost::asio::use_future);
    ioc.run();

    size_t healthy = 0;
    for (const auto& [address, ok] : future.get()) {
        if (ok)
            healthy++;
    }
    Logger::info("Proxy validation: " + std::to_string(healthy) + "/"
                 + std::to_string(config.proxies.size()) + " healthy");
}

int run_jobs(const Core::Config& config) {
    auto tpl = Templates::TemplateLoader::load_file(config.template_path);

    Proxy::Pool::ProxyPool pool(config.proxies, proxy_options(config));
    if (pool.empty())
        Logger::info("No proxies configured, fetching directly");
    else
        Logger::info("Loaded " + std::to_string(pool.size()) + " proxies");

    Network::Http::BeastFetcher beast(std::chrono::milliseconds(config.connect_timeout_ms));
    std::unique_ptr<Network::Http::Fetcher> extra;
    Network::Http::Fetcher*                 fetcher = &beast;
    if (config.fetcher == "curl") {
        extra   = std::make_unique<Network::Http::CurlFetcher>(static_cast<size_t>(config.threads * 2));
        fetcher = extra.get();
    }
    else if (config.fetcher == "browser") {
        extra   = std::make_unique<Browser::BrowserFetcher>(beast, "127.0.0.1", config.cdp_port);
        fetcher = extra.get();
    }

    Fetch::Defense::SignatureDefenseDetector detector =
        config.defense_markers.empty()
            ? Fetch::Defense::SignatureDefenseDetector()
            : Fetch::Defense::SignatureDefenseDetector(config.defense_markers);

    Fetch::Pipeline::PipelineOptions pipeline_options;
    pipeline_options.max_retries     = config.max_retries;
    pipeline_options.defense_retries = config.defense_retries;
    pipeline_options.backoff_base    = std::chrono::milliseconds(config.backoff_base_ms);
    pipeline_options.backoff_cap     = std::chrono::milliseconds(config.backoff_cap_ms);
    pipeline_options.proxy_wait      = std::chrono::milliseconds(config.proxy_wait_ms);
    Fetch::Pipeline::FetchPipeline pipeline(pool, *fetcher, detector, pipeline_options);
    if (!config.validate_url.empty() && !pool.empty())
        validate_proxies(pipeline, config);

    Engine::OrchestratorConfig orchestrator_config;
    orchestrator_config.io_threads               = config.threads;
    orchestrator_config.max_concurrent_jobs      = config.max_jobs;
    orchestrator_config.job_fetch_concurrency    = config.job_concurrency;
    orchestrator_config.max_consecutive_failures = config.max_consecutive_failures;
    orchestrator_config.cancel_grace             = std::chrono::milliseconds(config.cancel_grace_ms);

    Extract::Query::GumboParser parser;
    Sink::LogProgressSink       progress_sink;
    Sink::JsonResultSink        result_sink(config.output_dir);
    Engine::JobOrchestrator orchestrator(orchestrator_config, pipeline, parser, &progress_sink,
                                         &result_sink);

    std::vector<Engine::Job::JobId> ids;
    for (const auto& url : config.urls) {
        try {
            ids.push_back(orchestrator.submit({tpl->name, url, tpl}));
        } catch (const Core::InvalidJobError& e) {
            Logger::error("Skipping " + url + ": " + e.what());
        }
    }
    if (ids.empty())
        return EXIT_JOB_FAILED;

    // Ctrl-C cancels every job; results gathered so far are still written.
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&orchestrator](const boost::system::error_code& ec, int signal) {
        if (ec)
            return;
        Logger::warn("Received signal " + std::to_string(signal) + ", cancelling jobs...");
        orchestrator.cancel_all();
    });
    std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

    for (const auto& id : ids)
        orchestrator.start(id);

    bool any_failed    = false;
    bool any_cancelled = false;
    for (const auto& id : ids) {
        auto status = orchestrator.wait(id);
        if (status == Engine::Job::JobStatus::Failed)
            any_failed = true;
        else if (status == Engine::Job::JobStatus::Cancelled)
            any_cancelled = true;
        Logger::info("Job " + id + " finished: " + Engine::Job::to_string(status) + " -> "
                     + result_sink.path_for(id));
        orchestrator.remove(id);
    }

    signals.cancel();
    signal_ioc.stop();
    signal_thread.join();
    orchestrator.shutdown();

    if (any_cancelled)
        return EXIT_CANCELLED;
    return any_failed ? EXIT_JOB_FAILED : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = Core::Config{};
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const Core::ConfigError& e) {
        Logger::error(e.what());
        return 1;
    }
    Logger::set_level(Logger::parse_level(config.log_level));

    if (config.urls.empty()) {
        Logger::error("No URLs provided.");
        return 1;
    }
    if (config.template_path.empty()) {
        Logger::error("No template provided. Use --template.");
        return 1;
    }

    try {
        launch_browser_if_needed(config);
        return run_jobs(config);
    } catch (const Core::Error& e) {
        Logger::error(std::string(Core::to_string(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
