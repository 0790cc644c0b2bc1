#ifndef VPNCORE_THREAD_POOL_HPP
#define VPNCORE_THREAD_POOL_HPP

#include <algorithm>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <vpncore/thread/thread_name.hpp>

namespace vpn::thread_pool {
namespace detail {

/**
 * @brief a move-only implementation of std::function by Matthias Kretz, GSI
 * TODO(C++23): to be replaced by std::move_only_function once all supported standard libraries ship it
 */
class move_only_function {
    using FunPtr         = std::unique_ptr<void, void (*)(void*)>;
    FunPtr _erased_fun   = {nullptr, [](void*) {}};
    void (*_call)(void*) = nullptr;

public:
    constexpr move_only_function() = default;

    template<typename F>
    requires(!std::same_as<move_only_function, std::remove_cvref_t<F>> && !std::is_reference_v<F>)
    constexpr move_only_function(F&& fun) : _erased_fun(new F(std::forward<F>(fun)), [](void* ptr) { delete static_cast<F*>(ptr); }), _call([](void* ptr) { (*static_cast<F*>(ptr))(); }) {}

    template<typename F>
    requires(!std::same_as<move_only_function, std::remove_cvref_t<F>> && !std::is_reference_v<F>)
    constexpr move_only_function& operator=(F&& fun) {
        _erased_fun = FunPtr(new F(std::forward<F>(fun)), [](void* ptr) { delete static_cast<F*>(ptr); });
        _call       = [](void* ptr) { (*static_cast<F*>(ptr))(); };
        return *this;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return _call != nullptr; }

    constexpr void operator()() {
        if (_call) {
            _call(_erased_fun.get());
        }
    }

    constexpr void operator()() const {
        if (_call) {
            _call(_erased_fun.get());
        }
    }
};

} // namespace detail

/// type-erased sink for background work; tasks handed to `execute(..)` must not throw
struct TaskExecutor {
    virtual ~TaskExecutor() = default;

    virtual void execute(detail::move_only_function&& task) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual void               requestShutdown()  = 0;
    [[nodiscard]] virtual bool isShutdown() const = 0;
};

/**
 * @brief IO-bound worker pool growing between `[minThreads, maxThreads]`.
 *
 * A worker is added whenever more tasks are queued than there are idle workers (up to `maxThreads`). Workers
 * that stayed idle for `keepAlive` retire until `minThreads` are left. Queued tasks are drained before the
 * workers are joined on shutdown.
 * @code
 * auto pool = vpn::thread_pool::makeIoPool("vpn-worker", 1U, 8U);
 * pool->execute([] { readModuleVersion(); });
 * @endcode
 */
class BasicThreadPool final : public TaskExecutor {
    mutable std::mutex                     _mutex;
    std::condition_variable                _condition;
    std::deque<detail::move_only_function> _tasks;
    std::list<std::thread>                 _threads; // retired workers are joined on shutdown
    std::size_t                            _numThreads = 0UZ;
    std::size_t                            _numIdle    = 0UZ;
    bool                                   _shutdown   = false;

    const std::string               _name;
    const uint32_t                  _minThreads;
    const uint32_t                  _maxThreads;
    const std::chrono::milliseconds _keepAlive;

public:
    BasicThreadPool(std::string_view name, uint32_t minThreads, uint32_t maxThreads, std::chrono::milliseconds keepAlive = std::chrono::seconds(10)) : _name(name), _minThreads(std::min(minThreads, maxThreads)), _maxThreads(maxThreads), _keepAlive(keepAlive) {
        if (minThreads == 0U || maxThreads == 0U) {
            throw std::invalid_argument(fmt::format("pool '{}': minThreads and maxThreads must be > 0", _name));
        }
        std::scoped_lock lock(_mutex);
        for (uint32_t i = 0U; i < _minThreads; ++i) {
            spawnWorkerLocked();
        }
    }

    ~BasicThreadPool() override { requestShutdown(); }

    BasicThreadPool(const BasicThreadPool&)            = delete;
    BasicThreadPool& operator=(const BasicThreadPool&) = delete;

    void execute(detail::move_only_function&& task) override {
        {
            std::scoped_lock lock(_mutex);
            if (_shutdown) {
                throw std::logic_error(fmt::format("pool '{}' is shut down", _name));
            }
            _tasks.push_back(std::move(task));
            if (_tasks.size() > _numIdle && _numThreads < _maxThreads) {
                spawnWorkerLocked();
            }
        }
        _condition.notify_one();
    }

    void requestShutdown() override {
        std::list<std::thread> threads;
        {
            std::scoped_lock lock(_mutex);
            if (_shutdown) {
                return;
            }
            _shutdown = true;
            threads.swap(_threads);
        }
        _condition.notify_all();
        for (auto& thread : threads) {
            thread.join();
        }
    }

    [[nodiscard]] bool isShutdown() const override {
        std::scoped_lock lock(_mutex);
        return _shutdown;
    }

    [[nodiscard]] std::string_view name() const noexcept override { return _name; }
    [[nodiscard]] uint32_t         minThreads() const noexcept { return _minThreads; }
    [[nodiscard]] uint32_t         maxThreads() const noexcept { return _maxThreads; }

    [[nodiscard]] std::size_t numThreads() const {
        std::scoped_lock lock(_mutex);
        return _numThreads;
    }

private:
    void spawnWorkerLocked() {
        std::thread& worker = _threads.emplace_back(&BasicThreadPool::work, this);
        ++_numThreads;
        thread::setThreadName(fmt::format("{}#{}", _name, _threads.size() - 1UZ), worker);
    }

    void work() {
        std::unique_lock lock(_mutex);
        for (;;) {
            if (!_tasks.empty()) {
                {
                    detail::move_only_function task = std::move(_tasks.front());
                    _tasks.pop_front();
                    lock.unlock();
                    task();
                } // captured state is released without holding the lock
                lock.lock();
                continue;
            }
            if (_shutdown) { // queue is drained
                break;
            }
            ++_numIdle;
            const bool woken = _condition.wait_for(lock, _keepAlive, [this] { return !_tasks.empty() || _shutdown; });
            --_numIdle;
            if (!woken && _numThreads > _minThreads) {
                break;
            }
        }
        --_numThreads;
    }
};

[[nodiscard]] inline std::shared_ptr<TaskExecutor> makeIoPool(std::string_view name, uint32_t minThreads, uint32_t maxThreads) { return std::make_shared<BasicThreadPool>(name, minThreads, maxThreads); }

} // namespace vpn::thread_pool

#endif // VPNCORE_THREAD_POOL_HPP
