#ifndef VPNCORE_SERIAL_TASK_QUEUE_HPP
#define VPNCORE_SERIAL_TASK_QUEUE_HPP

#include <atomic>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <vpncore/CallbackLoop.hpp>
#include <vpncore/Error.hpp>
#include <vpncore/Log.hpp>
#include <vpncore/thread/SerialExecutor.hpp>
#include <vpncore/thread/thread_pool.hpp>

namespace vpn {

class SerialTaskQueue;

namespace detail {

template<typename T>
class TaskState {
public:
    using Continuation = std::function<void(const Result<T>&)>;

private:
    mutable std::mutex        _mutex;
    std::optional<Result<T>>  _result;
    std::vector<Continuation> _continuations;

public:
    // called on the callback thread only
    void deliver(Result<T> result) {
        std::vector<Continuation> pending;
        {
            std::scoped_lock lock(_mutex);
            _result.emplace(std::move(result));
            pending.swap(_continuations);
        }
        for (auto& continuation : pending) {
            continuation(*_result);
        }
    }

    /// @return false if the result was already delivered, `continuation` is left untouched in that case
    bool append(Continuation& continuation) {
        std::scoped_lock lock(_mutex);
        if (_result.has_value()) {
            return false;
        }
        _continuations.push_back(std::move(continuation));
        return true;
    }

    [[nodiscard]] bool isDelivered() const {
        std::scoped_lock lock(_mutex);
        return _result.has_value();
    }

    [[nodiscard]] const Result<T>& result() const { return *_result; } // only valid once delivered
};

template<typename Fn, typename T>
struct continuation_result {
    using type = std::invoke_result_t<Fn, T>;
};

template<typename Fn>
struct continuation_result<Fn, void> {
    using type = std::invoke_result_t<Fn>;
};

template<typename Fn, typename T>
using continuation_result_t = typename continuation_result<std::decay_t<Fn>, T>::type;

} // namespace detail

/**
 * @brief handle to the eventual result of a unit of work submitted to a `SerialTaskQueue`.
 *
 * Continuations always run on the queue's `CallbackLoop` thread and receive a `Result<T>`: either the value
 * or the `Error` the work failed with (anything thrown is converted at the worker boundary).
 * The queue has to outlive every handle that still has continuations pending.
 */
template<typename T>
class TaskHandle {
    SerialTaskQueue*                      _queue;
    std::shared_ptr<detail::TaskState<T>> _state;

public:
    using value_type   = T;
    using Continuation = typename detail::TaskState<T>::Continuation;

    TaskHandle(SerialTaskQueue& queue, std::shared_ptr<detail::TaskState<T>> state) : _queue(&queue), _state(std::move(state)) {}

    /// may be called multiple times, continuations fire in registration order
    TaskHandle& onComplete(Continuation continuation);

    /// submits `fn(value)` to the same queue once this result is delivered, errors skip `fn` and are forwarded
    template<typename Fn, typename U = result_value_t<detail::continuation_result_t<Fn, T>>>
    TaskHandle<U> thenSubmit(Fn&& fn);

    /// terminal consumer running on the callback thread, errors are logged and dropped
    template<typename Fn>
    void thenAccept(Fn&& fn);

    [[nodiscard]] bool isDone() const { return _state->isDelivered(); }
};

/**
 * @brief FIFO background task queue with completion delivery on a designated callback context.
 *
 * - `submit(work)` never blocks the caller beyond the enqueue.
 * - at most one unit of work executes at any time, units execute in submission order (`thread_pool::SerialExecutor`
 *   on top of a growable IO-bound worker pool),
 * - every result is posted to the `CallbackLoop`, hence continuations observe completions in submission order and
 *   never run on a worker thread,
 * - a failing unit of work (throwing or returning an `Error`) neither blocks nor cancels the following ones.
 *
 * @code
 * queue.submit([&] { return resolver.resolve(); })                      // runs on a worker
 *      .thenSubmit([](const BackendPtr& backend) { return backend->version(); }) // queued behind already submitted work
 *      .thenAccept([](const std::string& version) { show(version); });  // runs on the callback loop
 * @endcode
 */
class SerialTaskQueue {
    CallbackLoop&               _callbackLoop;
    thread_pool::SerialExecutor _executor;
    std::atomic_size_t          _numSubmitted = 0UZ;

public:
    SerialTaskQueue(std::shared_ptr<thread_pool::TaskExecutor> executor, CallbackLoop& callbackLoop) : _callbackLoop(callbackLoop), _executor(std::move(executor)) {}

    ~SerialTaskQueue() { _executor.waitUntilIdle(); }

    SerialTaskQueue(const SerialTaskQueue&)            = delete;
    SerialTaskQueue& operator=(const SerialTaskQueue&) = delete;

    template<std::invocable Fn, typename U = result_value_t<std::invoke_result_t<Fn>>>
    TaskHandle<U> submit(Fn&& work) {
        auto state = std::make_shared<detail::TaskState<U>>();
        submitInto<U>(state, std::forward<Fn>(work));
        return TaskHandle<U>(*this, std::move(state));
    }

    /// blocks until all submitted work has executed, completions may still be queued on the callback loop
    void waitUntilIdle() { _executor.waitUntilIdle(); }

    [[nodiscard]] CallbackLoop& callbackLoop() noexcept { return _callbackLoop; }
    [[nodiscard]] std::size_t   numTasksSubmitted() const noexcept { return _numSubmitted.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t   numTasksExecuted() const { return _executor.numTasksExecuted(); }
    [[nodiscard]] std::size_t   numTasksPending() const { return _executor.numTasksPending(); }

private:
    template<typename T>
    friend class TaskHandle;

    template<typename U, typename Work>
    void submitInto(std::shared_ptr<detail::TaskState<U>> state, Work&& work) {
        _numSubmitted.fetch_add(1UZ, std::memory_order_acq_rel);
        _executor.execute([&loop = _callbackLoop, state = std::move(state), work = std::forward<Work>(work)]() mutable {
            Result<U> result = invokeCatching<U>(work);
            loop.post([state = std::move(state), result = std::move(result)]() mutable { state->deliver(std::move(result)); });
        });
    }

    template<typename U, typename Work>
    static Result<U> invokeCatching(Work& work) {
        using R = std::invoke_result_t<Work&>;
        try {
            if constexpr (ResultLike<R>) {
                return work();
            } else if constexpr (std::is_void_v<R>) {
                work();
                return {};
            } else {
                return Result<U>(work());
            }
        } catch (const vpn::exception& e) {
            return std::unexpected(Error(e));
        } catch (const std::exception& e) {
            return std::unexpected(Error(e));
        } catch (...) {
            return std::unexpected(Error("work threw an exception not derived from std::exception"));
        }
    }
};

template<typename T>
TaskHandle<T>& TaskHandle<T>::onComplete(Continuation continuation) {
    if (_state->append(continuation)) {
        return *this;
    }
    CallbackLoop& loop = _queue->callbackLoop();
    if (loop.isCallbackThread()) {
        continuation(_state->result());
    } else {
        loop.post([state = _state, continuation = std::move(continuation)] { continuation(state->result()); });
    }
    return *this;
}

template<typename T>
template<typename Fn, typename U>
TaskHandle<U> TaskHandle<T>::thenSubmit(Fn&& fn) {
    auto next = std::make_shared<detail::TaskState<U>>();
    onComplete([queue = _queue, next, fn = std::forward<Fn>(fn)](const Result<T>& result) mutable {
        if (!result.has_value()) {
            next->deliver(std::unexpected(result.error()));
            return;
        }
        if constexpr (std::is_void_v<T>) {
            queue->template submitInto<U>(next, std::move(fn));
        } else {
            queue->template submitInto<U>(next, [fn = std::move(fn), value = *result]() mutable { return fn(std::move(value)); });
        }
    });
    return TaskHandle<U>(*_queue, std::move(next));
}

template<typename T>
template<typename Fn>
void TaskHandle<T>::thenAccept(Fn&& fn) {
    onComplete([fn = std::forward<Fn>(fn)](const Result<T>& result) mutable {
        if (!result.has_value()) {
            log::warning("SerialTaskQueue", "dropping failed result: {}", result.error());
            return;
        }
        if constexpr (std::is_void_v<T>) {
            fn();
        } else {
            fn(*result);
        }
    });
}

} // namespace vpn

#endif // VPNCORE_SERIAL_TASK_QUEUE_HPP
