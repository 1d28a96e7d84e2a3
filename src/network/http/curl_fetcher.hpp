#pragma once
#include <curl/curl.h>
#include <utility>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <string>
#include "fetcher.hpp"

namespace Gleaner {
namespace Network {
namespace Http {

// libcurl backend. Transfers are blocking, so each one runs on a private
// thread pool and the calling coroutine awaits its completion.
class CurlFetcher : public Fetcher {
public:
    explicit CurlFetcher(size_t worker_threads = 4);
    ~CurlFetcher() override;
    CurlFetcher(const CurlFetcher&)            = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    boost::asio::awaitable<RawDocument> fetch_raw(const std::string&       url,
                                                  const std::string&       proxy,
                                                  const FetchProfile&      profile,
                                                  const Core::CancelToken& cancel) override;

private:
    struct RequestContext {
        std::string*                        body    = nullptr;
        std::map<std::string, std::string>* headers = nullptr;
        const Core::CancelToken*            cancel  = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    RawDocument perform(const std::string&       url,
                        const std::string&       proxy,
                        const FetchProfile&      profile,
                        const Core::CancelToken& cancel) const;

    // Callbacks must be static. userp is always a RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);

    boost::asio::thread_pool pool_;
};

ErrorType map_curl_code(CURLcode code, bool via_proxy);

}  // namespace Http
}  // namespace Network
}  // namespace Gleaner
