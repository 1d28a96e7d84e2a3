#include "browser_fetcher.hpp"
#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <memory>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "cdp/cdp_client.hpp"

namespace Gleaner {
namespace Browser {

namespace net = boost::asio;
using nlohmann::json;

using Core::Logger;
using Network::Http::StealthLevel;

ErrorType map_net_error(const std::string& error_text) {
    using Utils::Text::icontains;
    if (icontains(error_text, "TIMED_OUT"))
        return ErrorType::Timeout;
    if (icontains(error_text, "PROXY") || icontains(error_text, "TUNNEL")
        || icontains(error_text, "SOCKS"))
        return ErrorType::Proxy;
    if (icontains(error_text, "CONNECTION_REFUSED") || icontains(error_text, "CONNECTION_RESET")
        || icontains(error_text, "ADDRESS_UNREACHABLE"))
        return ErrorType::Refused;
    if (icontains(error_text, "NAME_NOT_RESOLVED") || icontains(error_text, "NAME_RESOLUTION"))
        return ErrorType::Dns;
    return ErrorType::Network;
}

std::string to_proxy_server(const std::string& proxy) {
    auto parsed = Utils::Url::parse(proxy);
    if (parsed.host.empty())
        return "";

    std::string scheme = parsed.scheme.empty() ? "http" : parsed.scheme;
    if (scheme == "socks5h")
        scheme = "socks5";
    else if (scheme == "socks4a")
        scheme = "socks4";

    std::string out = scheme + "://" + parsed.host;
    if (!parsed.port.empty())
        out += ":" + parsed.port;
    return out;
}

BrowserFetcher::BrowserFetcher(Network::Http::Fetcher& plain, std::string host, int port)
    : plain_(plain), host_(std::move(host)), port_(port) {
}

bool BrowserFetcher::wants_browser(const FetchProfile& profile) {
    return profile.render_js || profile.stealth == StealthLevel::High;
}

net::awaitable<RawDocument> BrowserFetcher::fetch_raw(const std::string&       url,
                                                      const std::string&       proxy,
                                                      const FetchProfile&      profile,
                                                      const Core::CancelToken& cancel) {
    if (!wants_browser(profile))
        co_return co_await plain_.fetch_raw(url, proxy, profile, cancel);
    co_return co_await render(url, proxy, profile, cancel);
}

net::awaitable<RawDocument> BrowserFetcher::render(const std::string&       url,
                                                   const std::string&       proxy,
                                                   const FetchProfile&      profile,
                                                   const Core::CancelToken& cancel) {
    RawDocument doc;
    doc.url           = url;
    doc.effective_url = url;
    auto start        = std::chrono::steady_clock::now();

    if (!Utils::Url::is_http_url(url)) {
        doc.error      = "Invalid URL";
        doc.error_type = ErrorType::Network;
        co_return doc;
    }

    auto executor  = co_await net::this_coro::executor;
    auto client    = std::make_shared<CDP::CDPClient>(executor, host_, port_);
    auto timed_out = std::make_shared<bool>(false);

    // Whole-render deadline: closing the socket fails whatever read is pending.
    auto deadline = std::make_shared<net::steady_timer>(executor);
    deadline->expires_after(profile.timeout.count() > 0 ? profile.timeout
                                                        : std::chrono::milliseconds(30000));
    deadline->async_wait([client, timed_out](const boost::system::error_code& ec) {
        if (!ec) {
            *timed_out = true;
            client->abort();
        }
    });

    Core::CancelToken::Registration hook(cancel, [client] { client->abort(); });

    try {
        co_await client->connect(std::chrono::milliseconds(Core::Constants::CONNECT_TIMEOUT_MS));

        json context_params = {{"disposeOnDetach", true}};
        if (!proxy.empty())
            context_params["proxyServer"] = to_proxy_server(proxy);
        json        context    = co_await client->call("Target.createBrowserContext", context_params);
        std::string context_id = context.at("browserContextId").get<std::string>();

        json target_params = {{"url", "about:blank"}, {"browserContextId", context_id}};
        json target        = co_await client->call("Target.createTarget", target_params);
        json attach_params = {{"targetId", target.at("targetId").get<std::string>()}, {"flatten", true}};
        json attached      = co_await client->call("Target.attachToTarget", attach_params);
        std::string session = attached.at("sessionId").get<std::string>();

        auto proxy_url = Utils::Url::parse(proxy);
        if (!proxy_url.userinfo.empty()) {
            auto        colon = proxy_url.userinfo.find(':');
            std::string user  = proxy_url.userinfo.substr(0, colon);
            std::string pass  = colon == std::string::npos ? "" : proxy_url.userinfo.substr(colon + 1);
            client->set_proxy_credentials(session, user, pass);
            json fetch_params = {{"handleAuthRequests", true}};
            co_await client->call("Fetch.enable", fetch_params, session);
        }

        co_await client->call("Page.enable", json::object(), session);
        co_await client->call("Network.enable", json::object(), session);

        std::string user_agent = profile.user_agent;
        if (user_agent.empty() && profile.stealth == StealthLevel::High)
            user_agent = Core::get_browser_user_agents().front();
        if (!user_agent.empty()) {
            json ua_params = {{"userAgent", user_agent}};
            co_await client->call("Network.setUserAgentOverride", ua_params, session);
        }
        if (!profile.headers.empty()) {
            json headers = json::object();
            for (const auto& [name, value] : profile.headers)
                headers[name] = value;
            json headers_params = {{"headers", headers}};
            co_await client->call("Network.setExtraHTTPHeaders", headers_params, session);
        }

        Logger::debug("Browser: navigating to " + url);
        json nav_params = {{"url", url}};
        json nav        = co_await client->call("Page.navigate", nav_params, session);
        if (nav.contains("errorText") && !nav["errorText"].get<std::string>().empty()) {
            doc.error      = nav["errorText"].get<std::string>();
            doc.error_type = map_net_error(doc.error);
        }
        else {
            co_await client->wait_for_event("Page.loadEventFired", session);

            std::string loader_id = nav.value("loaderId", "");
            for (const auto& event : client->events("Network.responseReceived", session)) {
                const auto& params = event["params"];
                if (params.value("type", "") != "Document" || params.value("loaderId", "") != loader_id)
                    continue;
                const auto& response = params["response"];
                doc.status_code      = response.value("status", 0L);
                doc.effective_url    = response.value("url", url);
                doc.content_type     = response.value("mimeType", "");
                for (const auto& [name, value] : response.value("headers", json::object()).items()) {
                    if (value.is_string())
                        doc.headers[Utils::Text::to_lower(name)] = value.get<std::string>();
                }
            }
            // Served from cache or a data URL: the page loaded, so report it as 200.
            if (doc.status_code == 0)
                doc.status_code = static_cast<long>(Network::Http::HTTPCode::Ok);

            json eval_params = {{"expression", "document.documentElement.outerHTML"}, {"returnByValue", true}};
            json html = co_await client->call("Runtime.evaluate", eval_params, session);
            doc.body = html["result"].value("value", "");
            if (doc.body.empty()) {
                doc.error      = "Browser returned empty content";
                doc.error_type = ErrorType::Render;
            }
        }

        json dispose_params = {{"browserContextId", context_id}};
        co_await client->call("Target.disposeBrowserContext", dispose_params);
        co_await client->close();
    } catch (const boost::system::system_error& e) {
        doc.error      = e.code().message();
        doc.error_type = ErrorType::Browser;
    } catch (const CDP::CDPError& e) {
        doc.error      = e.what();
        doc.error_type = ErrorType::Browser;
    } catch (const json::exception& e) {
        doc.error      = std::string("Unexpected DevTools reply: ") + e.what();
        doc.error_type = ErrorType::Browser;
    }
    deadline->cancel();

    if (doc.error_type != ErrorType::None) {
        if (cancel.cancelled()) {
            doc.error      = "Cancelled";
            doc.error_type = ErrorType::Cancelled;
        }
        else if (*timed_out) {
            doc.error      = "Render timed out";
            doc.error_type = ErrorType::Timeout;
        }
        Logger::warn("Browser error [" + url + "]: " + doc.error);
    }

    doc.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    co_return doc;
}

}  // namespace Browser
}  // namespace Gleaner
