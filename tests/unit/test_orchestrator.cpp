#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include "../../src/core/errors/errors.hpp"
#include "../../src/engine/orchestrator/orchestrator.hpp"
#include "../../src/extract/query/gumbo_query.hpp"
#include "../../src/fetch/defense/defense_detector.hpp"
#include "../support/fake_fetcher.hpp"
#include "../support/recording_sinks.hpp"

using namespace Gleaner;
using namespace Gleaner::Testing;
using namespace std::chrono_literals;
using Engine::JobOrchestrator;
using Engine::OrchestratorConfig;
using Engine::Job::JobRequest;
using Engine::Job::JobStatus;
using Fetch::Pipeline::FetchPipeline;
using Fetch::Pipeline::PipelineOptions;
using Proxy::Pool::ProxyOptions;
using Proxy::Pool::ProxyPool;
using Templates::DiscoverySpec;
using Templates::FieldSpec;
using Templates::PaginationSpec;
using Templates::PaginationStrategy;
using Templates::Template;

namespace {

PipelineOptions quick() {
    PipelineOptions options;
    options.max_retries  = 2;
    options.backoff_base = 1ms;
    options.backoff_cap  = 2ms;
    options.proxy_wait   = 100ms;
    return options;
}

std::shared_ptr<Template> product_template(PaginationSpec pagination = {}) {
    auto tpl  = std::make_shared<Template>();
    tpl->name = "products";

    FieldSpec title;
    title.name     = "title";
    title.selector = "h1";
    title.required = true;

    FieldSpec price;
    price.name     = "price";
    price.selector = ".price";

    tpl->fields     = {title, price};
    tpl->pagination = pagination;
    return tpl;
}

PaginationSpec next_link(int max_pages) {
    PaginationSpec spec;
    spec.strategy      = PaginationStrategy::NextLink;
    spec.next_selector = "a.next";
    spec.max_pages     = max_pages;
    return spec;
}

PaginationSpec by_parameter(const std::string& pattern, int max_pages) {
    PaginationSpec spec;
    spec.strategy    = PaginationStrategy::PageParameter;
    spec.url_pattern = pattern;
    spec.max_pages   = max_pages;
    return spec;
}

std::string product_page(int n) {
    return "<html><body><h1>Product " + std::to_string(n) + "</h1><span class=\"price\">"
           + std::to_string(n * 10) + "</span><a class=\"next\" href=\"/p"
           + std::to_string(n + 1) + "\">Next</a></body></html>";
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3s) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() : pool(std::vector<std::string>{}), pipeline(pool, fetcher, detector, quick()) {
        config.io_threads    = 2;
        config.cancel_grace  = 200ms;
    }

    JobOrchestrator& orchestrator() {
        if (!orchestrator_)
            orchestrator_ = std::make_unique<JobOrchestrator>(
                config, pipeline, parser, &progress, &results);
        return *orchestrator_;
    }

    Engine::Job::JobId submit(const std::string& url, std::shared_ptr<const Template> tpl) {
        return orchestrator().submit(JobRequest{"test", url, std::move(tpl)});
    }

    FakeFetcher                              fetcher;
    Fetch::Defense::SignatureDefenseDetector detector;
    ProxyPool                                pool;
    FetchPipeline                            pipeline;
    Extract::Query::GumboParser              parser;
    RecordingProgressSink                    progress;
    RecordingResultSink                      results;
    OrchestratorConfig                       config;

private:
    std::unique_ptr<JobOrchestrator> orchestrator_;
};

}  // namespace

TEST_F(OrchestratorTest, StopsAtMaxPagesAndCompletes) {
    for (int n = 1; n <= 4; ++n)
        fetcher.route("http://shop.test/p" + std::to_string(n), product_page(n));

    auto id = submit("http://shop.test/p1", product_template(next_link(3)));
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    EXPECT_EQ(fetcher.call_count(), 3u);

    auto pages = orchestrator().results(id);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].url, "http://shop.test/p1");
    EXPECT_EQ(pages[1].url, "http://shop.test/p2");
    EXPECT_EQ(pages[2].url, "http://shop.test/p3");
    EXPECT_EQ(pages[0].next_url, "http://shop.test/p2");
    EXPECT_TRUE(pages[2].next_url.empty());
    EXPECT_EQ(pages[1].record["title"], "Product 2");
    EXPECT_EQ(pages[2].page_number, 3);

    auto progress_now = orchestrator().progress(id);
    EXPECT_EQ(progress_now.pages_fetched, 3u);
    EXPECT_EQ(progress_now.items_extracted, 3u);
    EXPECT_EQ(progress_now.items_failed, 0u);
    ASSERT_TRUE(progress_now.percent.has_value());
    EXPECT_DOUBLE_EQ(*progress_now.percent, 1.0);

    EXPECT_EQ(results.calls(id), 1);
    EXPECT_EQ(results.pages(id).size(), 3u);
}

TEST_F(OrchestratorTest, ProgressEventsAreMonotonic) {
    for (int n = 1; n <= 5; ++n)
        fetcher.route("http://shop.test/p" + std::to_string(n), product_page(n));

    auto id = submit("http://shop.test/p1", product_template(next_link(4)));
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    auto events = progress.events_for(id);
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front().progress.status, JobStatus::Queued);
    EXPECT_EQ(events.back().progress.status, JobStatus::Completed);
    EXPECT_EQ(events.back().progress.pages_fetched, 4u);

    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].progress.pages_fetched, events[i - 1].progress.pages_fetched);
        EXPECT_GE(events[i].progress.items_extracted, events[i - 1].progress.items_extracted);
    }
}

TEST_F(OrchestratorTest, CancelIsIdempotent) {
    fetcher.set_delay(10s);
    auto id = submit("http://shop.test/p1", product_template());
    orchestrator().start(id);
    ASSERT_TRUE(eventually([&] { return fetcher.call_count() > 0; }));

    orchestrator().cancel(id);
    orchestrator().cancel(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 3s));
    EXPECT_EQ(orchestrator().status(id), JobStatus::Cancelled);

    // Let the grace timer expire; it must not finalize a second time.
    std::this_thread::sleep_for(300ms);
    orchestrator().cancel(id);

    EXPECT_EQ(orchestrator().status(id), JobStatus::Cancelled);
    EXPECT_EQ(results.calls(id), 1);
    EXPECT_TRUE(orchestrator().results(id).empty());
}

TEST_F(OrchestratorTest, CancelBeforeStart) {
    auto id = submit("http://shop.test/p1", product_template());
    orchestrator().cancel(id);

    EXPECT_EQ(orchestrator().status(id), JobStatus::Cancelled);
    EXPECT_EQ(results.calls(id), 1);

    orchestrator().start(id);
    EXPECT_EQ(orchestrator().status(id), JobStatus::Cancelled);
    EXPECT_EQ(fetcher.call_count(), 0u);
}

TEST_F(OrchestratorTest, PauseHoldsAtPageBoundary) {
    fetcher.set_delay(20ms);
    fetcher.set_handler([](const std::string& url, const std::string&) {
        return make_page(url, "<html><h1>" + url + "</h1></html>");
    });

    auto id = submit("http://shop.test/list?page=1",
                     product_template(by_parameter("http://shop.test/list?page={page}", 6)));
    orchestrator().start(id);
    ASSERT_TRUE(eventually([&] { return orchestrator().progress(id).pages_fetched >= 1; }));

    ASSERT_TRUE(orchestrator().pause(id));
    EXPECT_FALSE(orchestrator().pause(id));
    EXPECT_EQ(orchestrator().status(id), JobStatus::Paused);

    // At most the page already in flight lands after the pause.
    std::this_thread::sleep_for(150ms);
    size_t held = orchestrator().progress(id).pages_fetched;
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(orchestrator().progress(id).pages_fetched, held);
    EXPECT_LT(held, 6u);

    ASSERT_TRUE(orchestrator().resume(id));
    EXPECT_FALSE(orchestrator().resume(id));
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    EXPECT_EQ(orchestrator().progress(id).pages_fetched, 6u);
}

TEST_F(OrchestratorTest, PauseDuringLastPageHoldsUntilResume) {
    fetcher.set_delay(300ms);
    fetcher.route("http://shop.test/p1", product_page(1));

    auto id = submit("http://shop.test/p1", product_template());
    orchestrator().start(id);
    ASSERT_TRUE(eventually([&] { return fetcher.call_count() > 0; }));
    ASSERT_TRUE(orchestrator().pause(id));

    // The page lands, but the job stays paused instead of completing.
    ASSERT_TRUE(eventually([&] { return orchestrator().progress(id).pages_fetched == 1; }));
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(orchestrator().status(id), JobStatus::Paused);
    EXPECT_FALSE(orchestrator().wait_for(id, 100ms));
    EXPECT_EQ(results.calls(id), 0);

    ASSERT_TRUE(orchestrator().resume(id));
    ASSERT_TRUE(orchestrator().wait_for(id, 3s));
    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    EXPECT_EQ(results.pages(id).size(), 1u);
}

TEST_F(OrchestratorTest, CancelAfterLastPageWhilePaused) {
    fetcher.set_delay(300ms);
    fetcher.route("http://shop.test/p1", product_page(1));

    auto id = submit("http://shop.test/p1", product_template());
    orchestrator().start(id);
    ASSERT_TRUE(eventually([&] { return fetcher.call_count() > 0; }));
    ASSERT_TRUE(orchestrator().pause(id));
    ASSERT_TRUE(eventually([&] { return orchestrator().progress(id).pages_fetched == 1; }));

    orchestrator().cancel(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 3s));
    EXPECT_EQ(orchestrator().status(id), JobStatus::Cancelled);
    EXPECT_EQ(results.calls(id), 1);
}

TEST_F(OrchestratorTest, RemoveForgetsOnlyFinishedJobs) {
    fetcher.route("http://shop.test/p1", product_page(1));

    auto done   = submit("http://shop.test/p1", product_template());
    auto queued = submit("http://shop.test/p2", product_template());
    orchestrator().start(done);
    ASSERT_TRUE(orchestrator().wait_for(done, 5s));

    EXPECT_EQ(orchestrator().jobs(), (std::vector<Engine::Job::JobId>{done, queued}));
    EXPECT_EQ(orchestrator().jobs(JobStatus::Completed), std::vector<Engine::Job::JobId>{done});
    EXPECT_EQ(orchestrator().jobs(JobStatus::Queued), std::vector<Engine::Job::JobId>{queued});
    EXPECT_TRUE(orchestrator().jobs(JobStatus::Failed).empty());

    EXPECT_FALSE(orchestrator().remove(queued));
    EXPECT_EQ(orchestrator().status(queued), JobStatus::Queued);

    EXPECT_TRUE(orchestrator().remove(done));
    EXPECT_EQ(orchestrator().jobs(), std::vector<Engine::Job::JobId>{queued});
    EXPECT_THROW(orchestrator().status(done), Core::InvalidJobError);
    EXPECT_THROW(orchestrator().remove(done), Core::InvalidJobError);
    EXPECT_EQ(results.calls(done), 1);
}

TEST_F(OrchestratorTest, ConsecutiveFailuresAbortTheJob) {
    config.max_consecutive_failures = 2;

    // Every page is a 404; page-parameter pagination keeps going past failures.
    auto id = submit("http://shop.test/list?page=1",
                     product_template(by_parameter("http://shop.test/list?page={page}", 0)));
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Failed);

    auto progress_now = orchestrator().progress(id);
    EXPECT_EQ(progress_now.pages_fetched, 2u);
    EXPECT_EQ(progress_now.items_failed, 2u);

    auto errors = orchestrator().errors(id);
    EXPECT_TRUE(std::any_of(errors.begin(), errors.end(), [](const std::string& e) {
        return e.find("consecutive page failures") != std::string::npos;
    }));

    auto pages = results.pages(id);
    ASSERT_EQ(pages.size(), 2u);
    ASSERT_TRUE(pages[0].error.has_value());
    EXPECT_EQ(pages[0].error->kind, "fetch_exhausted");
    EXPECT_EQ(pages[0].status_code, 0);
}

TEST_F(OrchestratorTest, RequiredFieldMissingEverywhereFails) {
    fetcher.route("http://shop.test/p1", "<html><body><p>no title here</p></body></html>");

    auto id = submit("http://shop.test/p1", product_template());
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Failed);
    auto pages = orchestrator().results(id);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_TRUE(pages[0].partial);
    EXPECT_DOUBLE_EQ(pages[0].coverage, 0.0);
    EXPECT_EQ(results.snapshot(id).terminal_reason, "Required fields missing on every page");
}

TEST_F(OrchestratorTest, PartialPagesStillComplete) {
    fetcher.route("http://shop.test/p1", product_page(1));
    fetcher.route("http://shop.test/p2", "<html><body><p>gone</p></body></html>");

    auto id = submit("http://shop.test/p1", product_template(next_link(2)));
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    auto pages = orchestrator().results(id);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_FALSE(pages[0].partial);
    EXPECT_TRUE(pages[1].partial);
    EXPECT_FALSE(orchestrator().errors(id).empty());
}

TEST_F(OrchestratorTest, JobsBeyondTheLimitWaitInQueue) {
    config.max_concurrent_jobs = 1;
    fetcher.set_delay(50ms);
    fetcher.route("http://shop.test/a", product_page(1));
    fetcher.route("http://shop.test/b", product_page(2));

    auto first  = submit("http://shop.test/a", product_template());
    auto second = submit("http://shop.test/b", product_template());
    orchestrator().start(first);
    orchestrator().start(second);

    EXPECT_EQ(orchestrator().status(first), JobStatus::Running);
    EXPECT_EQ(orchestrator().status(second), JobStatus::Queued);

    EXPECT_EQ(orchestrator().wait(first), JobStatus::Completed);
    EXPECT_EQ(orchestrator().wait(second), JobStatus::Completed);

    auto calls = fetcher.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].url, "http://shop.test/a");
    EXPECT_EQ(calls[1].url, "http://shop.test/b");
    EXPECT_EQ(orchestrator().jobs().size(), 2u);
}

TEST_F(OrchestratorTest, DiscoveryScrapesEachSeed) {
    fetcher.route("http://shop.test/",
                  "<html><body>"
                  "<a class=\"item\" href=\"/item/1\">1</a>"
                  "<a class=\"item\" href=\"/item/2\">2</a>"
                  "<a class=\"item\" href=\"/item/1#reviews\">1 again</a>"
                  "<a class=\"item\" href=\"http://other.test/x\">elsewhere</a>"
                  "</body></html>");
    fetcher.route("http://shop.test/item/1", product_page(1));
    fetcher.route("http://shop.test/item/2", product_page(2));

    auto tpl       = product_template();
    tpl->discovery = DiscoverySpec{"a.item", 0, true};

    auto id = submit("http://shop.test/", tpl);
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    auto pages = orchestrator().results(id);
    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].url, "http://shop.test/item/1");
    EXPECT_EQ(pages[0].seed, 0u);
    EXPECT_EQ(pages[1].url, "http://shop.test/item/2");
    EXPECT_EQ(pages[1].seed, 1u);
    EXPECT_EQ(orchestrator().progress(id).items_extracted, 2u);
}

TEST_F(OrchestratorTest, DiscoveryWithoutLinksScrapesStartPage) {
    fetcher.route("http://shop.test/p1", product_page(1));

    auto tpl       = product_template();
    tpl->discovery = DiscoverySpec{"a.item", 0, true};

    auto id = submit("http://shop.test/p1", tpl);
    orchestrator().start(id);
    ASSERT_TRUE(orchestrator().wait_for(id, 5s));

    EXPECT_EQ(orchestrator().status(id), JobStatus::Completed);
    auto pages = orchestrator().results(id);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].record["title"], "Product 1");
}

TEST_F(OrchestratorTest, RejectsInvalidJobs) {
    EXPECT_THROW(submit("ftp://shop.test/", product_template()), Core::InvalidJobError);
    EXPECT_THROW(submit("not a url", product_template()), Core::InvalidJobError);
    EXPECT_THROW(submit("http://shop.test/", nullptr), Core::InvalidJobError);

    auto bad_selector                = product_template();
    bad_selector->fields[0].selector = "a[href";
    EXPECT_THROW(submit("http://shop.test/", bad_selector), Core::InvalidJobError);

    auto no_fields    = product_template();
    no_fields->fields = {};
    EXPECT_THROW(submit("http://shop.test/", no_fields), Core::InvalidJobError);

    PaginationSpec missing_next;
    missing_next.strategy = PaginationStrategy::NextLink;
    EXPECT_THROW(submit("http://shop.test/", product_template(missing_next)), Core::InvalidJobError);

    EXPECT_THROW(submit("http://shop.test/",
                        product_template(by_parameter("http://shop.test/list", 3))),
                 Core::InvalidJobError);

    EXPECT_THROW(orchestrator().status("missing"), Core::InvalidJobError);
    EXPECT_TRUE(orchestrator().jobs().empty());
}

TEST_F(OrchestratorTest, ShutdownCancelsLiveJobs) {
    fetcher.set_delay(10s);
    auto running = submit("http://shop.test/p1", product_template());
    auto queued  = submit("http://shop.test/p2", product_template());
    orchestrator().start(running);
    ASSERT_TRUE(eventually([&] { return fetcher.call_count() > 0; }));

    orchestrator().shutdown();

    EXPECT_EQ(orchestrator().status(running), JobStatus::Cancelled);
    EXPECT_EQ(orchestrator().status(queued), JobStatus::Cancelled);
    EXPECT_EQ(results.calls(running), 1);
    EXPECT_EQ(results.calls(queued), 1);
    EXPECT_THROW(submit("http://shop.test/p3", product_template()), Core::InvalidJobError);
}

TEST(OrchestratorProxyTest, ExhaustedPoolFailsTheJob) {
    FakeFetcher fetcher;
    fetcher.set_handler([](const std::string& url, const std::string&) {
        return make_failure(url, Network::Http::ErrorType::Timeout);
    });

    ProxyOptions proxy_options;
    proxy_options.failure_threshold     = 1;
    proxy_options.cooldown              = 10s;
    proxy_options.domain_reuse_interval = 0ms;

    Fetch::Defense::SignatureDefenseDetector detector;
    ProxyPool                                pool({"http://p1:8080"}, proxy_options);
    FetchPipeline                            pipeline(pool, fetcher, detector, quick());
    Extract::Query::GumboParser              parser;
    RecordingResultSink                      results;

    OrchestratorConfig config;
    JobOrchestrator    orchestrator(config, pipeline, parser, nullptr, &results);

    auto id = orchestrator.submit(JobRequest{"proxied", "http://shop.test/p1", product_template()});
    orchestrator.start(id);
    ASSERT_TRUE(orchestrator.wait_for(id, 5s));

    EXPECT_EQ(orchestrator.status(id), JobStatus::Failed);
    auto errors = orchestrator.errors(id);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors.back().find("no_proxy_available"), std::string::npos);
    EXPECT_EQ(fetcher.call_count(), 1u);
    EXPECT_EQ(pool.stats().cooling_down, 1u);
}

TEST(OrchestratorProxyTest, DefenseWithRestOfPoolCoolingDownBlocksOnlyThePage) {
    FakeFetcher fetcher;
    fetcher.set_handler([](const std::string& url, const std::string&) {
        return make_page(url, "<html><body><div class=\"g-recaptcha\" data-sitekey=\"x\"></div></body></html>");
    });

    ProxyOptions proxy_options;
    proxy_options.failure_threshold     = 1;
    proxy_options.cooldown              = 10s;
    proxy_options.domain_reuse_interval = 0ms;

    Fetch::Defense::SignatureDefenseDetector detector;
    ProxyPool                                pool({"http://p1:8080", "http://p2:8080"}, proxy_options);
    pool.report(pool.stats().entries[1], Core::FetchOutcome::Refused, 1ms);
    FetchPipeline               pipeline(pool, fetcher, detector, quick());
    Extract::Query::GumboParser parser;
    RecordingResultSink         results;

    OrchestratorConfig config;
    JobOrchestrator    orchestrator(config, pipeline, parser, nullptr, &results);

    auto id = orchestrator.submit(JobRequest{"proxied", "http://shop.test/p1", product_template()});
    orchestrator.start(id);
    ASSERT_TRUE(orchestrator.wait_for(id, 5s));

    EXPECT_EQ(orchestrator.status(id), JobStatus::Completed);
    auto pages = orchestrator.results(id);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_FALSE(pages[0].success);
    ASSERT_TRUE(pages[0].error.has_value());
    EXPECT_EQ(pages[0].error->kind, "blocked");
    EXPECT_EQ(fetcher.call_count(), 1u);
}
