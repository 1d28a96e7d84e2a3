#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace Gleaner {
namespace Core {

struct CancelState;

// Shared cancellation flag with hooks that interrupt pending I/O.
// Copies refer to the same state.
class CancelToken {
public:
    using Callback = std::function<void()>;

    CancelToken();

    bool cancelled() const noexcept;

    // Sets the flag and runs every registered hook once. Idempotent.
    void cancel();

    // Runs immediately when already cancelled. Returns a handle for remove().
    size_t on_cancel(Callback callback);
    void   remove(size_t handle);

    // Hook lifetime bound to a scope.
    class Registration {
    public:
        Registration(const CancelToken& token, Callback callback);
        ~Registration();

        Registration(const Registration&)            = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        std::shared_ptr<CancelState> state_;
        size_t                              handle_;
    };

private:
    std::shared_ptr<CancelState> state_;
};

struct CancelState {
    std::atomic<bool>                       cancelled{false};
    std::mutex                              mutex;
    size_t                                  next_handle = 1;
    std::map<size_t, CancelToken::Callback> callbacks;

    size_t add(CancelToken::Callback callback);
    void   remove(size_t handle);
};

// Suspends the calling coroutine for `duration`. Returns false when the
// token was cancelled before or during the wait.
boost::asio::awaitable<bool> sleep_for(std::chrono::milliseconds duration,
                                       const CancelToken&        token);

}  // namespace Core
}  // namespace Gleaner
