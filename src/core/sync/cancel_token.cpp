#include "cancel_token.hpp"
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <vector>

namespace Gleaner {
namespace Core {

size_t CancelState::add(CancelToken::Callback callback) {
    std::unique_lock<std::mutex> lock(mutex);
    if (cancelled.load()) {
        lock.unlock();
        callback();
        return 0;
    }
    size_t handle     = next_handle++;
    callbacks[handle] = std::move(callback);
    return handle;
}

void CancelState::remove(size_t handle) {
    if (handle == 0)
        return;
    std::lock_guard<std::mutex> lock(mutex);
    callbacks.erase(handle);
}

CancelToken::CancelToken() : state_(std::make_shared<CancelState>()) {
}

bool CancelToken::cancelled() const noexcept {
    return state_->cancelled.load();
}

void CancelToken::cancel() {
    std::vector<Callback> pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true))
            return;
        for (auto& [handle, callback] : state_->callbacks)
            pending.push_back(std::move(callback));
        state_->callbacks.clear();
    }
    for (auto& callback : pending)
        callback();
}

size_t CancelToken::on_cancel(Callback callback) {
    return state_->add(std::move(callback));
}

void CancelToken::remove(size_t handle) {
    state_->remove(handle);
}

CancelToken::Registration::Registration(const CancelToken& token, Callback callback)
    : state_(token.state_), handle_(state_->add(std::move(callback))) {
}

CancelToken::Registration::~Registration() {
    state_->remove(handle_);
}

boost::asio::awaitable<bool> sleep_for(std::chrono::milliseconds duration,
                                       const CancelToken&        token) {
    if (token.cancelled())
        co_return false;
    if (duration.count() <= 0)
        co_return true;

    auto executor = co_await boost::asio::this_coro::executor;
    auto timer    = std::make_shared<boost::asio::steady_timer>(executor);
    timer->expires_after(duration);

    // steady_timer::cancel is not thread-safe; hop onto the timer's executor.
    CancelToken::Registration hook(token, [timer, executor]() {
        boost::asio::post(executor, [timer]() { timer->cancel(); });
    });

    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return !token.cancelled();
}

}  // namespace Core
}  // namespace Gleaner
