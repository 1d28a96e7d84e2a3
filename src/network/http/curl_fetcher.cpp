#include "curl_fetcher.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <random>
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

namespace net = boost::asio;

using Core::Constants;

namespace {

struct CurlGlobal {
    CurlGlobal() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

std::string pick_user_agent() {
    thread_local std::mt19937             rng(std::random_device{}());
    const auto&                           agents = Core::get_browser_user_agents();
    std::uniform_int_distribution<size_t> dist(0, agents.size() - 1);
    return agents[dist(rng)];
}

}  // namespace

ErrorType map_curl_code(CURLcode code, bool via_proxy) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_ABORTED_BY_CALLBACK: return ErrorType::Cancelled;
        case CURLE_COULDNT_CONNECT: return ErrorType::Refused;
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Proxy;
        case CURLE_COULDNT_RESOLVE_HOST: return via_proxy ? ErrorType::Proxy : ErrorType::Dns;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR: return via_proxy ? ErrorType::Proxy : ErrorType::Network;
        default: return ErrorType::Network;
    }
}

size_t CurlFetcher::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlFetcher::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<RequestContext*>(userp);
    if (!ctx || !ctx->headers)
        return size * nitems;

    std::string line(buffer, size * nitems);
    // A new status line starts a fresh header block after each redirect.
    if (Utils::Text::starts_with(line, "HTTP/")) {
        ctx->headers->clear();
        return size * nitems;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos)
        return size * nitems;

    (*ctx->headers)[Utils::Text::to_lower(Utils::Text::trim(line.substr(0, colon)))] =
        Utils::Text::trim(line.substr(colon + 1));
    return size * nitems;
}

int CurlFetcher::progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<RequestContext*>(userp);
    return (ctx && ctx->cancel && ctx->cancel->cancelled()) ? 1 : 0;
}

CurlFetcher::CurlFetcher(size_t worker_threads) : pool_(worker_threads) {
    ensure_curl_global();
}

CurlFetcher::~CurlFetcher() {
    pool_.join();
}

net::awaitable<RawDocument> CurlFetcher::fetch_raw(const std::string&       url,
                                                   const std::string&       proxy,
                                                   const FetchProfile&      profile,
                                                   const Core::CancelToken& cancel) {
    co_return co_await net::co_spawn(
        pool_.get_executor(),
        [this, url, proxy, profile, cancel]() -> net::awaitable<RawDocument> {
            co_return perform(url, proxy, profile, cancel);
        },
        net::use_awaitable);
}

RawDocument CurlFetcher::perform(const std::string&       url,
                                 const std::string&       proxy,
                                 const FetchProfile&      profile,
                                 const Core::CancelToken& cancel) const {
    RawDocument doc;
    doc.url           = url;
    doc.effective_url = url;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        doc.error      = "Failed to initialize CURL handle";
        doc.error_type = ErrorType::Network;
        return doc;
    }

    RequestContext ctx{&doc.body, &doc.headers, &cancel};
    CURL*          handle = curl.get();

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, static_cast<long>(Constants::MAX_REDIRECTS));
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(Constants::CONNECT_TIMEOUT_MS));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(profile.timeout.count()));

    std::string user_agent = profile.user_agent;
    if (user_agent.empty())
        user_agent = profile.stealth == StealthLevel::None ? Constants::USER_AGENT : pick_user_agent();
    curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent.c_str());

    if (!proxy.empty())
        curl_easy_setopt(handle, CURLOPT_PROXY, proxy.c_str());

    curl_slist* raw = nullptr;
    if (profile.stealth != StealthLevel::None) {
        raw = curl_slist_append(
            raw, "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8");
        raw = curl_slist_append(raw, "Accept-Language: en-US,en;q=0.9");
    }
    for (const auto& [name, value] : profile.headers)
        raw = curl_slist_append(raw, (name + ": " + value).c_str());
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw);
    if (raw)
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, raw);

    auto     start = std::chrono::steady_clock::now();
    CURLcode res   = curl_easy_perform(handle);
    doc.latency    = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    char* effective = nullptr;
    curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective);
    if (effective)
        doc.effective_url = effective;

    if (res != CURLE_OK) {
        doc.error       = curl_easy_strerror(res);
        doc.error_type  = cancel.cancelled() ? ErrorType::Cancelled : map_curl_code(res, !proxy.empty());
        doc.status_code = static_cast<long>(HTTPCode::NetworkError);
        doc.body.clear();
        return doc;
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &doc.status_code);
    auto ct = doc.headers.find("content-type");
    if (ct != doc.headers.end())
        doc.content_type = ct->second;
    return doc;
}

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
