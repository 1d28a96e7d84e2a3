#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../../src/network/http/fetcher.hpp"

namespace Gleaner {
namespace Testing {

using Network::Http::ErrorType;
using Network::Http::FetchProfile;
using Network::Http::RawDocument;

inline RawDocument make_page(const std::string& url, const std::string& body, long status = 200) {
    RawDocument doc;
    doc.url           = url;
    doc.effective_url = url;
    doc.status_code   = status;
    doc.content_type  = "text/html";
    doc.body          = body;
    doc.latency       = std::chrono::milliseconds(5);
    return doc;
}

inline RawDocument make_failure(const std::string& url, ErrorType type, const std::string& error = "") {
    RawDocument doc;
    doc.url        = url;
    doc.error_type = type;
    doc.error      = error.empty() ? Network::Http::to_string(type) : error;
    return doc;
}

/**
 * Scripted fetch backend. Responses are taken, in order, from the queue,
 * then the handler, then the static routes; anything else is a 404.
 */
class FakeFetcher : public Network::Http::Fetcher {
public:
    struct Call {
        std::string url;
        std::string proxy;
    };

    using Handler = std::function<RawDocument(const std::string& url, const std::string& proxy)>;

    void route(const std::string& url, const std::string& body, long status = 200) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = make_page(url, body, status);
    }

    void route(const std::string& url, RawDocument doc) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = std::move(doc);
    }

    void enqueue(RawDocument doc) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(doc));
    }

    void set_handler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // Every request waits this long first; the wait observes cancellation.
    void set_delay(std::chrono::milliseconds delay) {
        delay_ = delay;
    }

    boost::asio::awaitable<RawDocument> fetch_raw(const std::string&       url,
                                                  const std::string&       proxy,
                                                  const FetchProfile&      profile,
                                                  const Core::CancelToken& cancel) override {
        (void)profile;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({url, proxy});
        }

        if (!co_await Core::sleep_for(delay_, cancel))
            co_return make_failure(url, ErrorType::Cancelled);

        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            RawDocument doc = std::move(queue_.front());
            queue_.pop_front();
            co_return doc;
        }
        if (handler_)
            co_return handler_(url, proxy);
        auto it = routes_.find(url);
        if (it != routes_.end())
            co_return it->second;
        co_return make_page(url, "<html><body>Not found</body></html>", 404);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    mutable std::mutex                 mutex_;
    std::deque<RawDocument>            queue_;
    std::map<std::string, RawDocument> routes_;
    Handler                            handler_;
    std::vector<Call>                  calls_;
    std::chrono::milliseconds          delay_{0};
};

// Drives one coroutine to completion on a private io_context.
template <typename T>
T run_sync(boost::asio::awaitable<T> op) {
    boost::asio::io_context ioc;
    auto future = boost::asio::co_spawn(ioc, std::move(op), boost::asio::use_future);
    ioc.run();
    return future.get();
}

}  // namespace Testing
}  // namespace Gleaner
