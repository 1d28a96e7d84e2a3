#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <string>
#include "../../core/sync/cancel_token.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Refused, Timeout, Dns, Browser, Render, Cancelled };

const char* to_string(ErrorType type);

enum class HTTPCode { Ok = 200, NetworkError = 0, BrowserError = 599, NotFound = 404 };

enum class MaxCode { ClientError = 400 };

enum class StealthLevel { None = 0, Basic = 1, High = 2 };

// Fetch-profile hints a template carries; the fetch backend decides how to
// honour them.
struct FetchProfile {
    StealthLevel                       stealth = StealthLevel::Basic;
    std::chrono::milliseconds          min_delay{0};
    std::chrono::milliseconds          max_delay{0};
    std::string                        user_agent;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds          timeout{30000};
    bool                               render_js = false;
};

// Raw result of one backend request. Header names are lowercase.
struct RawDocument {
    std::string                        url;
    std::string                        effective_url;
    long                               status_code = 0;
    std::string                        content_type;
    std::map<std::string, std::string> headers;
    std::string                        body;
    std::string                        error;
    ErrorType                          error_type = ErrorType::None;
    std::chrono::milliseconds          latency{0};

    bool network_ok() const {
        return error_type == ErrorType::None;
    }
    const std::string& base_url() const {
        return effective_url.empty() ? url : effective_url;
    }
};

class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Never throws for network-level problems; those come back classified in
    // RawDocument::error_type. An empty proxy means a direct connection.
    virtual boost::asio::awaitable<RawDocument> fetch_raw(const std::string&       url,
                                                          const std::string&       proxy,
                                                          const FetchProfile&      profile,
                                                          const Core::CancelToken& cancel) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
