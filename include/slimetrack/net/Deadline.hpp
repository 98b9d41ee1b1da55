#pragma once
#include "slimetrack/net/NetConfig.hpp"
#include "slimetrack/log/Log.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

namespace slimetrack::net {

namespace detail {

// Outcome slot shared by the waiting thread, the operation handler and the
// timer handler. The first claim() wins; the waiter only returns after
// release(), so the winner can finish its side effects first.
struct DeadlineOutcome {
    std::mutex m;
    std::condition_variable cv;
    bool claimed = false;
    bool released = false;
    error_code ec = asio::error::would_block;

    bool claim(const error_code& result) {
        std::lock_guard<std::mutex> lk(m);
        if (claimed) return false;
        ec = result;
        claimed = true;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lk(m);
            released = true;
        }
        cv.notify_one();
    }

    error_code wait() {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [this] { return released; });
        return ec;
    }
};

} // namespace detail

/**
 * @brief Block the calling thread on an async operation bounded by a timer.
 *
 * `start_async(handler)` must launch one operation whose completion calls
 * `handler(ec, ...)`. A `steady_timer` on @p ex races it; if the timer wins,
 * `cancel()` runs on the executor before the caller is woken, and
 * `asio::error::timed_out` is returned. @p what names the operation in the
 * timeout log line.
 *
 * Handlers keep the outcome alive through a shared_ptr, so one that fires
 * after this function returned is harmless. `cancel` must own (or keep
 * alive) whatever it touches.
 *
 * The io_context must be running on another thread: calling this from one of
 * its own handlers deadlocks (EmulatedTracker refuses such calls up front).
 */
template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    milliseconds timeout,
    const char* what,
    StartAsync start_async,
    Cancel cancel)
{
    auto outcome = std::make_shared<detail::DeadlineOutcome>();
    auto timer = std::make_shared<asio::steady_timer>(ex, timeout);

    start_async([outcome, timer](const error_code& ec, auto&&...) {
        if (outcome->claim(ec)) {
            timer->cancel();
            outcome->release();
        }
    });

    timer->async_wait([outcome, timer, cancel, timeout, what](const error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (outcome->claim(asio::error::timed_out)) {
            logError("[with_deadline] ", what, " timed out after ", timeout.count(), "ms\n");
            cancel();
            outcome->release();
        }
    });

    return outcome->wait();
}

} // namespace slimetrack::net
