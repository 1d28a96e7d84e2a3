#include "cdp_client.hpp"
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http.hpp>
#include "../../core/logger/logger.hpp"

namespace Gleaner {
namespace Browser {
namespace CDP {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;
using nlohmann::json;

using Core::Logger;

namespace {

constexpr size_t MESSAGE_LIMIT = 64 * 1024 * 1024;

bool same_session(const json& message, const std::string& session) {
    if (session.empty())
        return !message.contains("sessionId");
    return message.value("sessionId", "") == session;
}

}  // namespace

CDPClient::CDPClient(net::any_io_executor executor, std::string host, int port)
    : executor_(executor), host_(std::move(host)), port_(port), ws_(executor) {
    ws_.read_message_max(MESSAGE_LIMIT);
}

net::awaitable<std::string> CDPClient::discover_endpoint() {
    tcp::resolver     resolver(executor_);
    beast::tcp_stream stream(executor_);

    auto results = co_await resolver.async_resolve(host_, std::to_string(port_), net::use_awaitable);
    stream.expires_after(std::chrono::seconds(5));
    co_await stream.async_connect(results, net::use_awaitable);

    http::request<http::empty_body> req{http::verb::get, "/json/version", 11};
    req.set(http::field::host, host_ + ":" + std::to_string(port_));
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    json version = json::parse(res.body(), nullptr, false);
    if (version.is_discarded() || !version.contains("webSocketDebuggerUrl"))
        throw CDPError("DevTools endpoint did not report a websocket URL");

    // ws://127.0.0.1:9222/devtools/browser/<id>
    std::string url  = version["webSocketDebuggerUrl"].get<std::string>();
    size_t      path = url.find('/', url.find("://") + 3);
    if (path == std::string::npos)
        throw CDPError("Malformed websocket URL: " + url);
    co_return url.substr(path);
}

net::awaitable<void> CDPClient::connect(std::chrono::milliseconds timeout) {
    std::string path = co_await discover_endpoint();

    tcp::resolver resolver(executor_);
    auto results = co_await resolver.async_resolve(host_, std::to_string(port_), net::use_awaitable);

    beast::get_lowest_layer(ws_).expires_after(timeout);
    co_await beast::get_lowest_layer(ws_).async_connect(results, net::use_awaitable);

    // The websocket keeps its own timers from here on.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    co_await ws_.async_handshake(host_ + ":" + std::to_string(port_), path, net::use_awaitable);
    connected_ = true;
    Logger::debug("CDP: connected to " + host_ + ":" + std::to_string(port_) + path);
}

net::awaitable<void> CDPClient::send(const json& message) {
    ws_.text(true);
    co_await ws_.async_write(net::buffer(message.dump()), net::use_awaitable);
}

net::awaitable<json> CDPClient::read_message() {
    beast::flat_buffer buffer;
    co_await ws_.async_read(buffer, net::use_awaitable);
    json message = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
    if (message.is_discarded())
        throw CDPError("Malformed DevTools message");
    co_return message;
}

// Request interception is only enabled for proxy authentication: paused
// requests continue untouched and auth challenges get the proxy credentials.
net::awaitable<bool> CDPClient::intercept(const json& event) {
    std::string method = event.value("method", "");
    if (method != "Fetch.requestPaused" && method != "Fetch.authRequired")
        co_return false;

    std::string session    = event.value("sessionId", "");
    std::string request_id = event["params"].value("requestId", "");
    json        reply      = {{"id", current_id_++}, {"sessionId", session}};

    if (method == "Fetch.requestPaused") {
        reply["method"] = "Fetch.continueRequest";
        reply["params"] = {{"requestId", request_id}};
    }
    else {
        json response = {{"response", "ProvideCredentials"},
                         {"username", auth_user_},
                         {"password", auth_pass_}};
        if (session != auth_session_)
            response = {{"response", "CancelAuth"}};
        reply["method"] = "Fetch.continueWithAuth";
        reply["params"] = {{"requestId", request_id}, {"authChallengeResponse", response}};
    }
    co_await send(reply);
    co_return true;
}

net::awaitable<json> CDPClient::call(const std::string& method,
                                     json               params,
                                     const std::string& session) {
    if (!connected_)
        throw CDPError("CDP client is not connected");

    int  id      = current_id_++;
    json message = {{"id", id}, {"method", method}, {"params", std::move(params)}};
    if (!session.empty())
        message["sessionId"] = session;
    co_await send(message);

    for (;;) {
        json reply = co_await read_message();
        if (reply.contains("id")) {
            if (reply["id"].get<int>() != id)
                continue;  // reply to a fire-and-forget interception command
            if (reply.contains("error")) {
                throw CDPError(method + " failed: "
                               + reply["error"].value("message", reply["error"].dump()));
            }
            co_return reply.value("result", json::object());
        }
        if (!co_await intercept(reply))
            events_.push_back(std::move(reply));
    }
}

net::awaitable<json> CDPClient::wait_for_event(const std::string& method, const std::string& session) {
    for (auto it = events_.begin(); it != events_.end(); ++it) {
        if (it->value("method", "") == method && same_session(*it, session)) {
            json event = std::move(*it);
            events_.erase(it);
            co_return event;
        }
    }

    for (;;) {
        json message = co_await read_message();
        if (message.contains("id"))
            continue;
        if (co_await intercept(message))
            continue;
        if (message.value("method", "") == method && same_session(message, session))
            co_return message;
        events_.push_back(std::move(message));
    }
}

std::vector<json> CDPClient::events(const std::string& method, const std::string& session) const {
    std::vector<json> out;
    for (const auto& event : events_) {
        if (event.value("method", "") == method && same_session(event, session))
            out.push_back(event);
    }
    return out;
}

void CDPClient::set_proxy_credentials(const std::string& session,
                                      const std::string& user,
                                      const std::string& pass) {
    auth_session_ = session;
    auth_user_    = user;
    auth_pass_    = pass;
}

void CDPClient::abort() {
    net::post(executor_, [self = shared_from_this()] {
        beast::error_code ec;
        beast::get_lowest_layer(self->ws_).socket().close(ec);
    });
}

net::awaitable<void> CDPClient::close() {
    if (!connected_)
        co_return;
    connected_ = false;

    beast::error_code ec;
    co_await ws_.async_close(websocket::close_code::normal,
                             net::redirect_error(net::use_awaitable, ec));
    if (ec)
        Logger::debug("CDP: close: " + ec.message());
}

}  // namespace CDP
}  // namespace Browser
}  // namespace Gleaner
