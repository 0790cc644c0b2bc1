#include <vpncore/CallbackLoop.hpp>

#include <algorithm>
#include <exception>

#include <vpncore/Error.hpp>
#include <vpncore/Log.hpp>

namespace vpn {

CallbackLoop::CallbackLoop(std::string_view name) : _name(name) {}

CallbackLoop::~CallbackLoop() { stopThread(); }

void CallbackLoop::post(Callback&& callback) {
    {
        std::scoped_lock lock(_mutex);
        _callbacks.push_back(std::move(callback));
    }
    _condition.notify_all();
}

void CallbackLoop::run() {
    claimCallbackThread();
    std::unique_lock lock(_mutex);
    while (!_stopRequested.load(std::memory_order_acquire)) {
        if (!executeOne(lock)) {
            _condition.wait(lock, [this] { return !_callbacks.empty() || _stopRequested.load(std::memory_order_acquire); });
        }
    }
    while (executeOne(lock)) {
    }
}

void CallbackLoop::requestStop() {
    {
        std::scoped_lock lock(_mutex);
        _stopRequested.store(true, std::memory_order_release);
    }
    _condition.notify_all();
}

void CallbackLoop::startThread() {
    if (_thread.joinable()) {
        throw vpn::exception(fmt::format("callback loop '{}' already has a running thread", _name));
    }
    _stopRequested.store(false, std::memory_order_release);
    _thread = std::thread([this] {
        thread_pool::thread::setThreadName(_name);
        run();
    });
}

void CallbackLoop::stopThread() {
    if (!_thread.joinable()) {
        return;
    }
    requestStop();
    _thread.join();
    _stopRequested.store(false, std::memory_order_release);
}

std::size_t CallbackLoop::processPending() {
    claimCallbackThread();
    std::unique_lock  lock(_mutex);
    const std::size_t nQueued   = _callbacks.size();
    std::size_t       nExecuted = 0UZ;
    while (nExecuted < nQueued && executeOne(lock)) {
        ++nExecuted;
    }
    return nExecuted;
}

std::size_t CallbackLoop::processFor(std::chrono::milliseconds duration) {
    claimCallbackThread();
    const auto       deadline  = std::chrono::steady_clock::now() + duration;
    std::size_t      nExecuted = 0UZ;
    std::unique_lock lock(_mutex);
    while (std::chrono::steady_clock::now() < deadline) {
        if (executeOne(lock)) {
            ++nExecuted;
            continue;
        }
        _condition.wait_until(lock, deadline, [this] { return !_callbacks.empty(); });
    }
    return nExecuted;
}

bool CallbackLoop::processUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    claimCallbackThread();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::unique_lock lock(_mutex);
        if (!executeOne(lock)) {
            // the predicate may depend on state changed by other threads, hence the bounded wait
            const auto wakeUp = std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(10));
            _condition.wait_until(lock, wakeUp, [this] { return !_callbacks.empty(); });
        }
    }
    return true;
}

bool CallbackLoop::isCallbackThread() const noexcept { return _callbackThread.load(std::memory_order_acquire) == std::this_thread::get_id(); }

std::size_t CallbackLoop::numPending() const {
    std::scoped_lock lock(_mutex);
    return _callbacks.size();
}

void CallbackLoop::claimCallbackThread() {
    const auto      self     = std::this_thread::get_id();
    std::thread::id expected = {};
    if (_callbackThread.compare_exchange_strong(expected, self, std::memory_order_acq_rel) || expected == self) {
        return;
    }
    throw vpn::exception(fmt::format("callback loop '{}' is already driven by another thread", _name));
}

bool CallbackLoop::executeOne(std::unique_lock<std::mutex>& lock) {
    if (_callbacks.empty()) {
        return false;
    }
    {
        Callback callback = std::move(_callbacks.front());
        _callbacks.pop_front();
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            log::error("CallbackLoop", "callback on '{}' threw: {}", _name, e.what());
        }
    } // captured state is released without holding the lock
    _numProcessed.fetch_add(1UZ, std::memory_order_acq_rel);
    lock.lock();
    return true;
}

} // namespace vpn
