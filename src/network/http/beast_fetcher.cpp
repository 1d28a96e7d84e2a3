#include "beast_fetcher.hpp"
#include <memory>
#include <random>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../proxy/socks_handshake.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Core::Constants;
using Core::Logger;

namespace {

constexpr size_t BODY_LIMIT = 32 * 1024 * 1024;

std::string default_port(const Utils::UrlParsed& url) {
    if (!url.port.empty())
        return url.port;
    if (url.scheme == "https")
        return "443";
    if (url.scheme == "socks4" || url.scheme == "socks4a" || url.scheme == "socks5"
        || url.scheme == "socks5h")
        return "1080";
    if (url.scheme.empty() || url.scheme == "http")
        return url.scheme.empty() ? "8080" : "80";
    return "80";
}

std::string origin_form(const Utils::UrlParsed& url) {
    std::string target = url.path.empty() ? "/" : url.path;
    if (!url.query.empty())
        target += "?" + url.query;
    return target;
}

std::string absolute_form(const Utils::UrlParsed& url) {
    std::string out = url.scheme + "://" + url.host;
    if (!url.port.empty())
        out += ":" + url.port;
    return out + origin_form(url);
}

bool is_socks(const std::string& scheme) {
    return Utils::Text::starts_with(scheme, "socks");
}

std::pair<std::string, std::string> split_userinfo(const std::string& userinfo) {
    auto colon = userinfo.find(':');
    if (colon == std::string::npos)
        return {userinfo, ""};
    return {userinfo.substr(0, colon), userinfo.substr(colon + 1)};
}

const std::string& pick_user_agent() {
    thread_local std::mt19937 rng(std::random_device{}());
    const auto&               agents = Core::get_browser_user_agents();
    std::uniform_int_distribution<size_t> dist(0, agents.size() - 1);
    return agents[dist(rng)];
}

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

template <class Stream>
net::awaitable<http::response<http::string_body>> exchange(
    Stream&                                stream,
    const http::request<http::empty_body>& req,
    std::chrono::milliseconds              timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                         buffer;
    http::response_parser<http::string_body>   parser;
    parser.body_limit(BODY_LIMIT);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    co_return parser.release();
}

}  // namespace

ErrorType classify_error(const boost::system::error_code& ec, bool via_proxy) {
    if (ec == beast::error::timeout)
        return ErrorType::Timeout;
    if (ec == net::error::operation_aborted)
        return ErrorType::Cancelled;
    if (ec == net::error::connection_refused || ec == net::error::connection_reset
        || ec == net::error::host_unreachable || ec == net::error::network_unreachable)
        return ErrorType::Refused;
    if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again
        || ec == net::error::no_data)
        return via_proxy ? ErrorType::Proxy : ErrorType::Dns;
    return ErrorType::Network;
}

BeastFetcher::BeastFetcher(std::chrono::milliseconds connect_timeout, bool verify_tls)
    : connect_timeout_(connect_timeout) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(verify_tls ? ssl::verify_peer : ssl::verify_none);
}

net::awaitable<RawDocument> BeastFetcher::fetch_raw(const std::string&       url,
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

    try {
        std::string current = url;
        for (int hop = 0;; ++hop) {
            if (cancel.cancelled()) {
                doc.error      = "Cancelled";
                doc.error_type = ErrorType::Cancelled;
                break;
            }

            auto parsed = Utils::Url::parse(current);
            auto res    = co_await request_once(parsed, proxy, profile, cancel);

            auto location = res.find(http::field::location);
            if (is_redirect(res.result_int()) && location != res.end()
                && hop < Constants::MAX_REDIRECTS) {
                std::string next = Utils::Url::resolve(current, std::string(location->value()));
                if (!next.empty()) {
                    Logger::debug("Redirect " + current + " -> " + next);
                    current = next;
                    continue;
                }
            }

            doc.effective_url = current;
            doc.status_code   = res.result_int();
            for (const auto& field : res) {
                doc.headers[Utils::Text::to_lower(std::string(field.name_string()))] =
                    std::string(field.value());
            }
            auto ct = res.find(http::field::content_type);
            if (ct != res.end())
                doc.content_type = std::string(ct->value());
            doc.body = std::move(res.body());
            break;
        }
    } catch (const boost::system::system_error& e) {
        doc.error      = e.code().message();
        doc.error_type = classify_error(e.code(), !proxy.empty());
    } catch (const std::exception& e) {
        // SOCKS and CONNECT rejections surface as plain runtime errors.
        doc.error      = e.what();
        doc.error_type = proxy.empty() ? ErrorType::Network : ErrorType::Proxy;
    }

    if (cancel.cancelled() && doc.error_type != ErrorType::None) {
        doc.error      = "Cancelled";
        doc.error_type = ErrorType::Cancelled;
    }

    doc.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    co_return doc;
}

net::awaitable<BeastFetcher::Response> BeastFetcher::request_once(
    const Utils::UrlParsed&  target,
    const std::string&       proxy,
    const FetchProfile&      profile,
    const Core::CancelToken& cancel) {
    auto executor = co_await net::this_coro::executor;

    std::string host = target.host;
    std::string port = default_port(target);
    bool        tls  = target.scheme == "https";

    Utils::UrlParsed proxy_url;
    if (!proxy.empty())
        proxy_url = Utils::Url::parse(proxy);
    bool via_proxy   = !proxy_url.host.empty();
    bool forward_get = via_proxy && !tls && !is_socks(proxy_url.scheme);

    std::string connect_host = via_proxy ? proxy_url.host : host;
    std::string connect_port = via_proxy ? default_port(proxy_url) : port;

    auto resolver = std::make_shared<tcp::resolver>(executor);
    auto plain    = std::make_shared<beast::tcp_stream>(executor);
    auto secure   = std::make_shared<beast::ssl_stream<beast::tcp_stream>>(executor, ssl_ctx_);
    beast::tcp_stream& lowest = tls ? beast::get_lowest_layer(*secure) : *plain;

    Core::CancelToken::Registration hook(cancel, [executor, resolver, plain, secure] {
        net::post(executor, [resolver, plain, secure] {
            resolver->cancel();
            beast::error_code ec;
            plain->socket().close(ec);
            beast::get_lowest_layer(*secure).socket().close(ec);
        });
    });

    auto results = co_await resolver->async_resolve(connect_host, connect_port, net::use_awaitable);

    lowest.expires_after(connect_timeout_);
    co_await lowest.async_connect(results, net::use_awaitable);

    if (via_proxy && !forward_get)
        co_await open_tunnel(lowest, proxy_url, host, port);

    std::chrono::milliseconds timeout = profile.timeout.count() > 0
                                            ? profile.timeout
                                            : std::chrono::milliseconds(
                                                  Constants::REQUEST_TIMEOUT_SECONDS * 1000);

    if (!tls) {
        auto req = build_request(target, forward_get ? absolute_form(target) : origin_form(target),
                                 profile);
        if (forward_get && !proxy_url.userinfo.empty()) {
            req.set(http::field::proxy_authorization,
                    "Basic " + Utils::Text::base64_encode(proxy_url.userinfo));
        }
        auto res = co_await exchange(*plain, req, timeout);

        beast::error_code ec;
        plain->socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    if (!SSL_set_tlsext_host_name(secure->native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    lowest.expires_after(connect_timeout_);
    co_await secure->async_handshake(ssl::stream_base::client, net::use_awaitable);

    auto res = co_await exchange(*secure, build_request(target, origin_form(target), profile),
                                 timeout);

    // Many servers drop the connection without a close_notify.
    beast::error_code ec;
    lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return res;
}

net::awaitable<void> BeastFetcher::open_tunnel(beast::tcp_stream&      stream,
                                               const Utils::UrlParsed& proxy,
                                               const std::string&      host,
                                               const std::string&      port) {
    auto [user, pass] = split_userinfo(proxy.userinfo);

    if (proxy.scheme == "socks5" || proxy.scheme == "socks5h") {
        co_await Proxy::SocksHandshake::perform_socks5(stream.socket(), host, port, user, pass);
        co_return;
    }
    if (proxy.scheme == "socks4" || proxy.scheme == "socks4a") {
        co_await Proxy::SocksHandshake::perform_socks4(stream.socket(), host, port, user);
        co_return;
    }

    // HTTP CONNECT
    http::request<http::empty_body> req{http::verb::connect, host + ":" + port, 11};
    req.set(http::field::host, host + ":" + port);
    req.set(http::field::user_agent, Constants::USER_AGENT);
    if (!proxy.userinfo.empty())
        req.set(http::field::proxy_authorization,
                "Basic " + Utils::Text::base64_encode(proxy.userinfo));

    stream.expires_after(connect_timeout_);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);

    if (parser.get().result() != http::status::ok) {
        throw std::runtime_error("Proxy CONNECT failed with status "
                                 + std::to_string(parser.get().result_int()));
    }
}

BeastFetcher::Request BeastFetcher::build_request(const Utils::UrlParsed& target,
                                                  const std::string&      request_target,
                                                  const FetchProfile&     profile) const {
    Request req{http::verb::get, request_target, 11};

    std::string host_header = target.host;
    if (!target.port.empty())
        host_header += ":" + target.port;
    req.set(http::field::host, host_header);

    if (!profile.user_agent.empty())
        req.set(http::field::user_agent, profile.user_agent);
    else if (profile.stealth == StealthLevel::None)
        req.set(http::field::user_agent, Constants::USER_AGENT);
    else
        req.set(http::field::user_agent, pick_user_agent());

    if (profile.stealth != StealthLevel::None) {
        req.set(http::field::accept,
                "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8");
        req.set(http::field::accept_language, "en-US,en;q=0.9");
        req.set("Upgrade-Insecure-Requests", "1");
    }
    if (profile.stealth == StealthLevel::High) {
        req.set(http::field::cache_control, "max-age=0");
        req.set("Sec-Fetch-Dest", "document");
        req.set("Sec-Fetch-Mode", "navigate");
        req.set("Sec-Fetch-Site", "none");
    }
    req.set(http::field::accept_encoding, "identity");
    req.set(http::field::connection, "close");

    for (const auto& [name, value] : profile.headers)
        req.set(name, value);
    return req;
}

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
