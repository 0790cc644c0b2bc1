#ifndef VPNCORE_ONE_SHOT_FUTURE_HPP
#define VPNCORE_ONE_SHOT_FUTURE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <source_location>
#include <utility>
#include <vector>

#include <vpncore/Error.hpp>
#include <vpncore/Log.hpp>

namespace vpn {

/**
 * @brief single-assignment result cell with an ordered list of continuations.
 *
 * - `complete(value)` may be called exactly once; a second call is a programming error and throws `vpn::exception`.
 *   All continuations registered so far are invoked synchronously, in registration order, on the completing thread.
 *   A continuation throwing a `std::exception` is logged and does not prevent the remaining ones from running.
 * - `onComplete(fn)` invokes `fn` immediately (on the calling thread) if the value is already set, otherwise it is queued.
 *   Each registration fires exactly once, registering the same callable twice fires it twice.
 * - `getBlocking()` waits for `complete(..)` from another thread.
 *
 * @warning never call `getBlocking()` from the thread that is expected to drive the completion (typically the
 * `CallbackLoop` thread): this deadlocks and is not detected.
 *
 * The value is immutable once set and is handed out by const reference or copy.
 */
template<typename T>
class OneShotFuture {
public:
    using value_type   = T;
    using Continuation = std::function<void(const T&)>;

private:
    mutable std::mutex              _mutex;
    mutable std::condition_variable _completed;
    std::optional<T>                _value;
    std::vector<Continuation>       _continuations;

public:
    OneShotFuture() = default;

    OneShotFuture(const OneShotFuture&)            = delete;
    OneShotFuture& operator=(const OneShotFuture&) = delete;

    void complete(T value, std::source_location location = std::source_location::current()) {
        std::vector<Continuation> pending;
        {
            std::scoped_lock lock(_mutex);
            if (_value.has_value()) {
                throw vpn::exception("OneShotFuture::complete(..) called more than once", location);
            }
            _value.emplace(std::move(value));
            pending.swap(_continuations);
        }
        _completed.notify_all();
        for (auto& continuation : pending) {
            try {
                continuation(*_value); // _value no longer changes, safe to read without the lock
            } catch (const std::exception& e) {
                log::error("OneShotFuture", "continuation threw: {}", e.what());
            }
        }
    }

    void onComplete(Continuation continuation) {
        {
            std::scoped_lock lock(_mutex);
            if (!_value.has_value()) {
                _continuations.push_back(std::move(continuation));
                return;
            }
        }
        continuation(*_value);
    }

    [[nodiscard]] const T& getBlocking() const {
        std::unique_lock lock(_mutex);
        _completed.wait(lock, [this] { return _value.has_value(); });
        return *_value;
    }

    [[nodiscard]] std::optional<T> getBlocking(std::chrono::milliseconds timeout) const {
        std::unique_lock lock(_mutex);
        if (!_completed.wait_for(lock, timeout, [this] { return _value.has_value(); })) {
            return std::nullopt;
        }
        return _value;
    }

    [[nodiscard]] std::optional<T> peek() const {
        std::scoped_lock lock(_mutex);
        return _value;
    }

    [[nodiscard]] bool isComplete() const {
        std::scoped_lock lock(_mutex);
        return _value.has_value();
    }

    [[nodiscard]] std::size_t numPendingContinuations() const {
        std::scoped_lock lock(_mutex);
        return _continuations.size();
    }
};

} // namespace vpn

#endif // VPNCORE_ONE_SHOT_FUTURE_HPP
