#ifndef VPNCORE_SERIAL_EXECUTOR_HPP
#define VPNCORE_SERIAL_EXECUTOR_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <vpncore/Log.hpp>
#include <vpncore/thread/thread_pool.hpp>

namespace vpn::thread_pool {

/**
 * @brief Funnels work onto a (possibly multi-threaded) `TaskExecutor` as a single logical stream.
 *
 * At most one task is handed to the underlying executor at any time; the next one is dispatched from
 * the worker that just finished the previous one. Tasks therefore never overlap and execute in
 * submission order, while the underlying pool is free to choose a different worker for each of them.
 *
 * A task that throws (anything) is logged and does not prevent the following tasks from running.
 * The destructor blocks until the tasks already handed over have finished.
 */
class SerialExecutor {
    std::shared_ptr<TaskExecutor>          _executor;
    mutable std::mutex                     _mutex;
    std::condition_variable                _idle;
    std::deque<detail::move_only_function> _tasks;
    bool                                   _active      = false;
    std::size_t                            _numExecuted = 0UZ;

public:
    explicit SerialExecutor(std::shared_ptr<TaskExecutor> executor) : _executor(std::move(executor)) {
        if (!_executor) {
            throw std::invalid_argument("SerialExecutor requires a non-null TaskExecutor");
        }
    }

    ~SerialExecutor() { waitUntilIdle(); }

    SerialExecutor(const SerialExecutor&)            = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    void execute(detail::move_only_function&& task) {
        std::scoped_lock lock(_mutex);
        _tasks.push_back(std::move(task));
        if (!_active) {
            scheduleNext();
        }
    }

    void waitUntilIdle() {
        std::unique_lock lock(_mutex);
        _idle.wait(lock, [this] { return !_active && _tasks.empty(); });
    }

    [[nodiscard]] std::size_t numTasksPending() const {
        std::scoped_lock lock(_mutex);
        return _tasks.size() + (_active ? 1UZ : 0UZ);
    }

    [[nodiscard]] std::size_t numTasksExecuted() const {
        std::scoped_lock lock(_mutex);
        return _numExecuted;
    }

private:
    // requires _mutex to be held
    void scheduleNext() {
        if (_tasks.empty()) {
            _active = false;
            _idle.notify_all();
            return;
        }
        _active   = true;
        auto task = std::move(_tasks.front());
        _tasks.pop_front();
        try {
            _executor->execute([this, task = std::move(task)]() mutable {
                try {
                    task();
                } catch (const std::exception& e) {
                    log::error("SerialExecutor", "serial task threw: {}", e.what());
                } catch (...) { // a worker must survive any task, the following ones still run
                    log::error("SerialExecutor", "serial task threw an exception not derived from std::exception");
                }
                std::scoped_lock lock(_mutex);
                ++_numExecuted;
                scheduleNext();
            });
        } catch (...) { // executor refused the task (e.g. shut down): release waiters before propagating
            _active = false;
            _idle.notify_all();
            throw;
        }
    }
};

} // namespace vpn::thread_pool

#endif // VPNCORE_SERIAL_EXECUTOR_HPP
