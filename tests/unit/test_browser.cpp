#include <gtest/gtest.h>
#include "../../src/browser/browser_fetcher.hpp"
#include "../../src/browser/launcher/browser_launcher.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../support/fake_fetcher.hpp"

using namespace Gleaner;
using namespace Gleaner::Browser;
using Network::Http::StealthLevel;

TEST(BrowserFetcherTest, MapsNavigationErrors) {
    EXPECT_EQ(map_net_error("net::ERR_TIMED_OUT"), ErrorType::Timeout);
    EXPECT_EQ(map_net_error("net::ERR_CONNECTION_TIMED_OUT"), ErrorType::Timeout);
    EXPECT_EQ(map_net_error("net::ERR_PROXY_CONNECTION_FAILED"), ErrorType::Proxy);
    EXPECT_EQ(map_net_error("net::ERR_TUNNEL_CONNECTION_FAILED"), ErrorType::Proxy);
    EXPECT_EQ(map_net_error("net::ERR_SOCKS_CONNECTION_FAILED"), ErrorType::Proxy);
    EXPECT_EQ(map_net_error("net::ERR_CONNECTION_REFUSED"), ErrorType::Refused);
    EXPECT_EQ(map_net_error("net::ERR_CONNECTION_RESET"), ErrorType::Refused);
    EXPECT_EQ(map_net_error("net::ERR_NAME_NOT_RESOLVED"), ErrorType::Dns);
    EXPECT_EQ(map_net_error("net::ERR_CERT_AUTHORITY_INVALID"), ErrorType::Network);
}

TEST(BrowserFetcherTest, ProxyServerForm) {
    EXPECT_EQ(to_proxy_server("http://user:pw@p1.test:8080"), "http://p1.test:8080");
    EXPECT_EQ(to_proxy_server("socks5h://p2.test:1080"), "socks5://p2.test:1080");
    EXPECT_EQ(to_proxy_server("socks4a://p3.test:1080"), "socks4://p3.test:1080");
    EXPECT_EQ(to_proxy_server("https://p4.test"), "https://p4.test");
    EXPECT_EQ(to_proxy_server(""), "");
}

TEST(BrowserFetcherTest, OnlyRenderingProfilesUseTheBrowser) {
    FetchProfile profile;
    EXPECT_FALSE(BrowserFetcher::wants_browser(profile));
    profile.stealth = StealthLevel::High;
    EXPECT_TRUE(BrowserFetcher::wants_browser(profile));
    profile.stealth   = StealthLevel::None;
    profile.render_js = true;
    EXPECT_TRUE(BrowserFetcher::wants_browser(profile));
}

TEST(BrowserFetcherTest, PlainProfilesGoToTheHttpBackend) {
    Testing::FakeFetcher plain;
    plain.route("https://shop.test/", "<html><h1>plain</h1></html>");
    BrowserFetcher fetcher(plain, "127.0.0.1", 1);

    Core::CancelToken cancel;
    auto doc = Testing::run_sync(fetcher.fetch_raw("https://shop.test/", "", FetchProfile{}, cancel));

    EXPECT_TRUE(doc.network_ok());
    EXPECT_EQ(doc.status_code, 200);
    EXPECT_EQ(plain.call_count(), 1u);
}

TEST(BrowserFetcherTest, UnreachableDevToolsIsAnError) {
    Core::Logger::set_level(Core::LOG_NONE);
    Testing::FakeFetcher plain;
    BrowserFetcher       fetcher(plain, "127.0.0.1", 1);

    FetchProfile profile;
    profile.render_js = true;
    profile.timeout   = std::chrono::milliseconds(2000);

    Core::CancelToken cancel;
    auto doc = Testing::run_sync(fetcher.fetch_raw("https://shop.test/", "", profile, cancel));

    EXPECT_FALSE(doc.network_ok());
    EXPECT_EQ(plain.call_count(), 0u);
    Core::Logger::set_level(Core::LOG_DEFAULT);
}

TEST(LauncherTest, MissingBinaryFailsToLaunch) {
    Core::Logger::set_level(Core::LOG_NONE);
    EXPECT_FALSE(Launcher::BrowserLauncher::launch("/non/existent/path", 9999, true));
    Core::Logger::set_level(Core::LOG_DEFAULT);
}
