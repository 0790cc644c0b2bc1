#ifndef VPNCORE_CALLBACK_LOOP_HPP
#define VPNCORE_CALLBACK_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <vpncore/Export.hpp>
#include <vpncore/thread/thread_pool.hpp>

namespace vpn {

/**
 * @brief the designated callback context: a single-threaded FIFO event loop.
 *
 * Any thread may `post(..)` callbacks; they are executed one by one, in posting order, by the thread that
 * drives the loop. The loop is driven either by the owner calling `run()` / `processPending()` /
 * `processUntil(..)`, or by an owned thread started with `startThread(..)`. The first thread that drives
 * the loop becomes its callback thread; driving it from any other thread afterwards throws.
 *
 * Exceptions derived from `std::exception` escaping a callback are logged and do not stop the loop.
 */
class VPNCORE_EXPORT CallbackLoop {
    using Callback = thread_pool::detail::move_only_function;

    mutable std::mutex           _mutex;
    std::condition_variable      _condition;
    std::deque<Callback>         _callbacks;
    std::atomic<std::thread::id> _callbackThread{};
    std::atomic_bool             _stopRequested = false;
    std::atomic_size_t           _numProcessed  = 0UZ;
    std::string                  _name;
    std::thread                  _thread;

public:
    explicit CallbackLoop(std::string_view name = "main");
    ~CallbackLoop();

    CallbackLoop(const CallbackLoop&)            = delete;
    CallbackLoop& operator=(const CallbackLoop&) = delete;

    void post(Callback&& callback);

    /// runs until `requestStop()`, the remaining callbacks are processed before returning
    void run();
    void requestStop();

    /// starts an owned thread that runs the loop, stopped and joined by `stopThread()` or the destructor
    void startThread();
    void stopThread();

    /// executes the callbacks that are queued at the time of the call, @return number executed
    std::size_t processPending();

    /// executes callbacks for at most `duration`, waiting for new ones while idle
    std::size_t processFor(std::chrono::milliseconds duration);

    /// executes callbacks until `predicate()` holds, @return whether it holds before `timeout` expired
    bool processUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5));

    [[nodiscard]] bool             isCallbackThread() const noexcept;
    [[nodiscard]] std::string_view name() const noexcept { return _name; }
    [[nodiscard]] std::size_t      numPending() const;
    [[nodiscard]] std::size_t      numProcessed() const noexcept { return _numProcessed.load(std::memory_order_acquire); }

private:
    void claimCallbackThread();
    bool executeOne(std::unique_lock<std::mutex>& lock);
};

} // namespace vpn

#endif // VPNCORE_CALLBACK_LOOP_HPP
