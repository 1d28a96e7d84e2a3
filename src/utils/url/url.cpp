#include "url.hpp"
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Gleaner {
namespace Utils {

namespace {

std::string authority_of(const UrlParsed& parsed) {
    std::string auth = parsed.host;
    if (!parsed.port.empty())
        auth += ":" + parsed.port;
    return auth;
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i < segments.size() - 1)
            normalized += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

std::string build(const UrlParsed& parsed) {
    std::string out = parsed.scheme + "://" + authority_of(parsed) + parsed.path;
    if (!parsed.query.empty())
        out += "?" + parsed.query;
    if (!parsed.fragment.empty())
        out += "#" + parsed.fragment;
    return out;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos && colon > 0);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = (end_auth != std::string_view::npos) ? sv.substr(end_auth) : std::string_view{};

        size_t      at        = authority.find_last_of('@');
        std::string host_port = authority;
        if (at != std::string::npos) {
            parsed.userinfo = authority.substr(0, at);
            host_port       = authority.substr(at + 1);
        }

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos)
                    parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }
    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string rel = Text::trim(relative);
    if (rel.empty())
        return base;

    UrlParsed base_parsed = parse(base);

    if (rel[0] == '#') {
        base_parsed.fragment = rel.substr(1);
        return build(base_parsed);
    }

    if (rel[0] == '?') {
        base_parsed.fragment.clear();
        UrlParsed rel_parsed = parse("x:" + rel);
        base_parsed.query    = rel_parsed.query;
        base_parsed.fragment = rel_parsed.fragment;
        return build(base_parsed);
    }

    if (rel.find("://") != std::string::npos)
        return rel;

    // javascript:, mailto:, data: and friends never resolve to a fetchable page.
    size_t colon_pos = rel.find(':');
    size_t slash_pos = rel.find('/');
    if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos))
        return "";

    if (rel.compare(0, 2, "//") == 0)
        return base_parsed.scheme + ":" + rel;

    UrlParsed rel_parsed = parse(rel);
    std::string path;
    if (rel[0] == '/') {
        path = rel_parsed.path;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        dir  = (last_slash != std::string::npos) ? dir.substr(0, last_slash + 1) : "/";
        path = dir + rel_parsed.path;
    }

    UrlParsed out = base_parsed;
    out.path      = remove_dot_segments(path);
    out.query     = rel_parsed.query;
    out.fragment  = rel_parsed.fragment;
    return build(out);
}

std::string Url::normalize(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (parsed.scheme.empty() || parsed.host.empty())
        return url;

    parsed.host = Text::to_lower(parsed.host);
    if (!parsed.host.empty() && parsed.host.back() == '.')
        parsed.host.pop_back();
    if ((parsed.scheme == "http" && parsed.port == "80")
        || (parsed.scheme == "https" && parsed.port == "443"))
        parsed.port.clear();
    parsed.fragment.clear();
    parsed.path = remove_dot_segments(parsed.path);
    return build(parsed);
}

bool Url::is_http_url(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (parsed.scheme != "http" && parsed.scheme != "https")
        return false;
    if (parsed.host.empty() || parsed.host.find_first_of(" \t\r\n") != std::string::npos)
        return false;
    for (char c : parsed.port) {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

std::string Url::host_of(const std::string& url) {
    std::string host = Text::to_lower(parse(url).host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return host;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    return host_of(url1) == host_of(url2);
}

}  // namespace Utils
}  // namespace Gleaner
