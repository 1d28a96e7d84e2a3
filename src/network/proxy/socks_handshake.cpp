#include "socks_handshake.hpp"
#include <array>
#include <utility>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace Gleaner::Network::Proxy {

namespace net = boost::asio;

namespace {

constexpr uint8_t SOCKS4_VERSION   = 0x04;
constexpr uint8_t SOCKS5_VERSION   = 0x05;
constexpr uint8_t CMD_CONNECT      = 0x01;
constexpr uint8_t SOCKS4_GRANTED   = 0x5A;
constexpr uint8_t AUTH_NONE        = 0x00;
constexpr uint8_t AUTH_USER_PASS   = 0x02;
constexpr uint8_t AUTH_REJECTED    = 0xFF;
constexpr uint8_t ATYP_IPV4        = 0x01;
constexpr uint8_t ATYP_DOMAIN      = 0x03;
constexpr uint8_t ATYP_IPV6        = 0x04;

void append_port(std::vector<uint8_t>& out, const std::string& port) {
    int value = std::stoi(port);
    if (value <= 0 || value > 0xFFFF)
        throw std::runtime_error("Invalid port for SOCKS request: " + port);
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void append_short_string(std::vector<uint8_t>& out, const std::string& value) {
    if (value.size() > 0xFF)
        throw std::runtime_error("SOCKS field longer than 255 bytes");
    out.push_back(static_cast<uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

}  // namespace

net::awaitable<void> SocksHandshake::perform_socks4(net::ip::tcp::socket& socket,
                                                    const std::string&    host,
                                                    const std::string&    port,
                                                    const std::string&    user) {
    std::vector<uint8_t> request{SOCKS4_VERSION, CMD_CONNECT};
    append_port(request, port);

    boost::system::error_code ec;
    net::ip::address          addr = net::ip::make_address(host, ec);
    bool                      use_4a = ec || !addr.is_v4();
    if (use_4a) {
        // 0.0.0.x tells the proxy to resolve the hostname appended after the user id.
        request.insert(request.end(), {0x00, 0x00, 0x00, 0x01});
    }
    else {
        auto bytes = addr.to_v4().to_bytes();
        request.insert(request.end(), bytes.begin(), bytes.end());
    }
    request.insert(request.end(), user.begin(), user.end());
    request.push_back(0x00);
    if (use_4a) {
        request.insert(request.end(), host.begin(), host.end());
        request.push_back(0x00);
    }

    co_await net::async_write(socket, net::buffer(request), net::use_awaitable);

    std::array<uint8_t, 8> reply{};
    co_await net::async_read(socket, net::buffer(reply), net::use_awaitable);
    if (reply[1] != SOCKS4_GRANTED)
        throw std::runtime_error("SOCKS4 request rejected (code " + std::to_string(reply[1]) + ")");
    co_return;
}

net::awaitable<void> SocksHandshake::perform_socks5(net::ip::tcp::socket& socket,
                                                    const std::string&    host,
                                                    const std::string&    port,
                                                    const std::string&    user,
                                                    const std::string&    pass) {
    bool                 with_auth = !user.empty();
    std::vector<uint8_t> greeting{SOCKS5_VERSION, 0x01, with_auth ? AUTH_USER_PASS : AUTH_NONE};
    co_await net::async_write(socket, net::buffer(greeting), net::use_awaitable);

    std::array<uint8_t, 2> choice{};
    co_await net::async_read(socket, net::buffer(choice), net::use_awaitable);
    if (choice[0] != SOCKS5_VERSION || choice[1] == AUTH_REJECTED)
        throw std::runtime_error("SOCKS5 handshake failed (no acceptable auth method)");

    if (choice[1] == AUTH_USER_PASS) {
        std::vector<uint8_t> auth{0x01};
        append_short_string(auth, user);
        append_short_string(auth, pass);
        co_await net::async_write(socket, net::buffer(auth), net::use_awaitable);

        std::array<uint8_t, 2> auth_reply{};
        co_await net::async_read(socket, net::buffer(auth_reply), net::use_awaitable);
        if (auth_reply[1] != 0x00)
            throw std::runtime_error("SOCKS5 authentication rejected");
    }

    std::vector<uint8_t> request{SOCKS5_VERSION, CMD_CONNECT, 0x00, ATYP_DOMAIN};
    append_short_string(request, host);
    append_port(request, port);
    co_await net::async_write(socket, net::buffer(request), net::use_awaitable);

    std::array<uint8_t, 4> header{};
    co_await net::async_read(socket, net::buffer(header), net::use_awaitable);
    if (header[1] != 0x00)
        throw std::runtime_error("SOCKS5 connect failed (code " + std::to_string(header[1]) + ")");

    size_t addr_len = 0;
    if (header[3] == ATYP_IPV4) {
        addr_len = 4;
    }
    else if (header[3] == ATYP_DOMAIN) {
        uint8_t domain_len = 0;
        co_await net::async_read(socket, net::buffer(&domain_len, 1), net::use_awaitable);
        addr_len = domain_len;
    }
    else if (header[3] == ATYP_IPV6) {
        addr_len = 16;
    }

    std::vector<uint8_t> bound(addr_len + 2);
    co_await net::async_read(socket, net::buffer(bound), net::use_awaitable);
    co_return;
}

}  // namespace Gleaner::Network::Proxy
