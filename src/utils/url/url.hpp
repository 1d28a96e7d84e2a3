#pragma once
#include <string>

namespace Gleaner {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // Lowercases scheme and host, drops the fragment and default ports.
    static std::string normalize(const std::string& url);

    // True for absolute http(s) URLs with a host.
    static bool        is_http_url(const std::string& url);
    static std::string host_of(const std::string& url);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);
};

}  // namespace Utils
}  // namespace Gleaner
