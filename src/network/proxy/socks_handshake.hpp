#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <string>

namespace Gleaner::Network::Proxy {

/**
 * @brief SOCKS4 and SOCKS5 client handshakes on an already connected socket.
 *
 * Both throw std::runtime_error when the proxy rejects the request; the
 * caller classifies that as a proxy failure.
 */
class SocksHandshake {
public:
    /**
     * @brief SOCKS4 CONNECT. Hostnames use the SOCKS4a extension.
     */
    static boost::asio::awaitable<void> perform_socks4(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user = "");

    /**
     * @brief SOCKS5 CONNECT with optional username/password authentication (RFC 1929).
     */
    static boost::asio::awaitable<void> perform_socks5(boost::asio::ip::tcp::socket& socket,
                                                       const std::string&            host,
                                                       const std::string&            port,
                                                       const std::string&            user = "",
                                                       const std::string&            pass = "");
};

}  // namespace Gleaner::Network::Proxy
