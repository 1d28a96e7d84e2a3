#include "fetcher.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Network: return "network";
        case ErrorType::Proxy: return "proxy";
        case ErrorType::Refused: return "refused";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Dns: return "dns";
        case ErrorType::Browser: return "browser";
        case ErrorType::Render: return "render";
        case ErrorType::Cancelled: return "cancelled";
    }
    return "unknown";
}

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
