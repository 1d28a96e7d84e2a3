#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <string>
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "fetcher.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

/**
 * @brief Plain HTTP(S) backend on Boost.Beast.
 *
 * Supports direct connections, HTTP forward proxies (CONNECT for https
 * targets) and SOCKS4/4a/5 proxies, follows redirects and classifies
 * every failure into an ErrorType instead of throwing.
 */
class BeastFetcher : public Fetcher {
public:
    explicit BeastFetcher(std::chrono::milliseconds connect_timeout =
                              std::chrono::milliseconds(Core::Constants::CONNECT_TIMEOUT_MS),
                          bool verify_tls = true);

    boost::asio::awaitable<RawDocument> fetch_raw(const std::string&       url,
                                                  const std::string&       proxy,
                                                  const FetchProfile&      profile,
                                                  const Core::CancelToken& cancel) override;

private:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Request  = boost::beast::http::request<boost::beast::http::empty_body>;

    boost::asio::awaitable<Response> request_once(const Utils::UrlParsed&  target,
                                                  const std::string&       proxy,
                                                  const FetchProfile&      profile,
                                                  const Core::CancelToken& cancel);

    boost::asio::awaitable<void> open_tunnel(boost::beast::tcp_stream& stream,
                                             const Utils::UrlParsed&   proxy,
                                             const std::string&        host,
                                             const std::string&        port);

    Request build_request(const Utils::UrlParsed& target,
                          const std::string&      request_target,
                          const FetchProfile&     profile) const;

    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
    std::chrono::milliseconds connect_timeout_;
};

// Maps a Boost.System error raised during a request to its ErrorType.
ErrorType classify_error(const boost::system::error_code& ec, bool via_proxy);

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
