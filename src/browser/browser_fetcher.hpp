#pragma once
#include <chrono>
#include <string>
#include "../core/types/constants.hpp"
#include "../network/http/fetcher.hpp"

namespace Gleaner {
namespace Browser {

using Network::Http::ErrorType;
using Network::Http::FetchProfile;
using Network::Http::RawDocument;

/**
 * @brief Renders pages in Chromium through the DevTools protocol.
 *
 * Each fetch gets an isolated browser context carrying its own proxy, so
 * concurrent fetches never share cookies or exits. Profiles that do not ask
 * for rendering (render_js off, stealth below High) go to @p plain instead.
 */
class BrowserFetcher : public Network::Http::Fetcher {
public:
    BrowserFetcher(Network::Http::Fetcher& plain,
                   std::string             host = "127.0.0.1",
                   int                     port = Core::Constants::DEFAULT_CDP_PORT);

    boost::asio::awaitable<RawDocument> fetch_raw(const std::string&       url,
                                                  const std::string&       proxy,
                                                  const FetchProfile&      profile,
                                                  const Core::CancelToken& cancel) override;

    static bool wants_browser(const FetchProfile& profile);

private:
    boost::asio::awaitable<RawDocument> render(const std::string&       url,
                                               const std::string&       proxy,
                                               const FetchProfile&      profile,
                                               const Core::CancelToken& cancel);

    Network::Http::Fetcher& plain_;
    std::string             host_;
    int                     port_;
};

// "net::ERR_CONNECTION_REFUSED" and friends, as reported by Page.navigate.
ErrorType map_net_error(const std::string& error_text);

// Chromium --proxy-server form of a proxy URL ("socks5://host:1080").
std::string to_proxy_server(const std::string& proxy);

}  // namespace Browser
}  // namespace Gleaner
