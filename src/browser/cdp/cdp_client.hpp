#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"

namespace Gleaner {
namespace Browser {
namespace CDP {

// Protocol-level failure: an error reply, a malformed message or a missing field.
class CDPError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Minimal Chrome DevTools Protocol client over a Beast websocket.
 *
 * Talks to the browser-level endpoint and addresses pages through flattened
 * target sessions. Replies are matched by id; every other message is kept
 * as an event until someone asks for it.
 */
class CDPClient : public std::enable_shared_from_this<CDPClient> {
public:
    CDPClient(boost::asio::any_io_executor executor,
              std::string                  host = "127.0.0.1",
              int                          port = Core::Constants::DEFAULT_CDP_PORT);

    boost::asio::awaitable<void> connect(std::chrono::milliseconds timeout);

    // Sends a command and waits for its reply. Throws CDPError on an error reply.
    boost::asio::awaitable<nlohmann::json> call(const std::string& method,
                                                nlohmann::json     params  = nlohmann::json::object(),
                                                const std::string& session = "");

    // Returns the first event named @p method for @p session, buffered or not.
    boost::asio::awaitable<nlohmann::json> wait_for_event(const std::string& method,
                                                          const std::string& session);

    // Buffered events with this name, oldest first.
    std::vector<nlohmann::json> events(const std::string& method, const std::string& session) const;

    // Answers Fetch.authRequired for @p session with these credentials.
    void set_proxy_credentials(const std::string& session,
                               const std::string& user,
                               const std::string& pass);

    // Closes the socket from any thread; pending reads fail.
    void abort();

    boost::asio::awaitable<void> close();

private:
    boost::asio::awaitable<std::string>    discover_endpoint();
    boost::asio::awaitable<void>           send(const nlohmann::json& message);
    boost::asio::awaitable<nlohmann::json> read_message();
    boost::asio::awaitable<bool>           intercept(const nlohmann::json& event);

    boost::asio::any_io_executor                              executor_;
    std::string                                               host_;
    int                                                       port_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    bool                                                      connected_ = false;

    int                        current_id_ = 1;
    std::deque<nlohmann::json> events_;

    std::string auth_session_;
    std::string auth_user_;
    std::string auth_pass_;
};

}  // namespace CDP
}  // namespace Browser
}  // namespace Gleaner
