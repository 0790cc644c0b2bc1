#ifndef VPNCORE_CONTEXT_HPP
#define VPNCORE_CONTEXT_HPP

#include <atomic>
#include <memory>
#include <utility>

#include <vpncore/Backend.hpp>
#include <vpncore/BackendResolver.hpp>
#include <vpncore/CallbackLoop.hpp>
#include <vpncore/Diagnostics.hpp>
#include <vpncore/Export.hpp>
#include <vpncore/KernelModuleProbe.hpp>
#include <vpncore/MetadataPublisher.hpp>
#include <vpncore/OneShotFuture.hpp>
#include <vpncore/PrivilegedSession.hpp>
#include <vpncore/SerialTaskQueue.hpp>
#include <vpncore/Settings.hpp>
#include <vpncore/thread/thread_pool.hpp>

namespace vpn {

/**
 * @brief the process-wide service graph of the VPN client core, owned by the application and passed by reference.
 *
 * Construction order: callback loop, worker pool and task queue, privileged session, backend resolver, backend
 * future, metadata publisher. With `enable_diagnostics` the constructor submits backend resolution to the task
 * queue; the future is completed on the callback loop and the backend identity is recorded with the diagnostics
 * sink. Without it, resolution is deferred to the first `backend()` call, which posts the completion of the future
 * to the callback loop (or completes it inline when called on the callback thread).
 *
 * Future continuations therefore always run on the callback thread and may call `backend()` themselves.
 *
 * The callback loop is not started by the context: call `callbackLoop().startThread()` or drive it manually.
 */
class VPNCORE_EXPORT Context {
public:
    /// injection seams, empty members are replaced by the production implementation derived from `Settings`
    struct Collaborators {
        KernelMarkerProbe                          markerProbe;
        std::shared_ptr<PrivilegedSession>         session;
        BackendFactories                           factories;
        std::shared_ptr<DiagnosticsSink>           diagnostics;
        std::shared_ptr<thread_pool::TaskExecutor> workers;
    };

private:
    Settings                                   _settings;
    std::shared_ptr<DiagnosticsSink>           _diagnostics;
    CallbackLoop                               _callbackLoop{"callback"};
    std::shared_ptr<thread_pool::TaskExecutor> _workers;
    SerialTaskQueue                            _taskQueue;
    std::shared_ptr<PrivilegedSession>         _session;
    BackendResolver                            _resolver;
    OneShotFuture<BackendPtr>                  _backendFuture;
    MetadataPublisher                          _publisher;
    std::atomic_bool                           _futureCompletionClaimed{false};

public:
    explicit Context(Settings settings = {});
    Context(Settings settings, Collaborators collaborators);
    ~Context();

    Context(const Context&)            = delete;
    Context& operator=(const Context&) = delete;

    /// blocks until the backend is resolved; callable from any thread, including future continuations
    [[nodiscard]] BackendPtr                 backend();
    [[nodiscard]] OneShotFuture<BackendPtr>& backendAsync() noexcept { return _backendFuture; }

    template<std::invocable Fn>
    auto submit(Fn&& work) {
        return _taskQueue.submit(std::forward<Fn>(work));
    }

    [[nodiscard]] SerialTaskQueue&   taskQueue() noexcept { return _taskQueue; }
    [[nodiscard]] CallbackLoop&      callbackLoop() noexcept { return _callbackLoop; }
    [[nodiscard]] PrivilegedSession& privilegedSession() noexcept { return *_session; }
    [[nodiscard]] DiagnosticsSink&   diagnostics() noexcept { return *_diagnostics; }
    [[nodiscard]] BackendResolver&   resolver() noexcept { return _resolver; }
    [[nodiscard]] const Settings&    settings() const noexcept { return _settings; }

private:
    struct Prepared {
        Settings      settings;
        Collaborators collaborators;
    };
    static Prepared withDefaults(Settings settings, Collaborators collaborators);

    explicit Context(Prepared prepared);
    void completeFuture(const BackendPtr& backend);
};

} // namespace vpn

#endif // VPNCORE_CONTEXT_HPP
