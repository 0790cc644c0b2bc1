#include <vpncore/Context.hpp>

#include <vpncore/Log.hpp>
#include <vpncore/RootShell.hpp>

namespace vpn {

namespace {
constexpr std::string_view kComponent = "Context";
}

Context::Prepared Context::withDefaults(Settings settings, Collaborators collaborators) {
    if (!collaborators.markerProbe) {
        collaborators.markerProbe = KernelModuleProbe{.markerPath = settings.kernel_module_path};
    }
    if (!collaborators.session) {
        collaborators.session = std::make_shared<RootShell>(RootShell::Options{.elevationCommand = settings.elevation_command, .requireRoot = settings.require_root});
    }
    if (!collaborators.factories.makeKernel || !collaborators.factories.makeUserspace) {
        BackendFactories defaults = defaultBackendFactories(settings.kernel_module_path, settings.userspace_version);
        if (!collaborators.factories.makeKernel) {
            collaborators.factories.makeKernel = std::move(defaults.makeKernel);
        }
        if (!collaborators.factories.makeUserspace) {
            collaborators.factories.makeUserspace = std::move(defaults.makeUserspace);
        }
    }
    if (!collaborators.diagnostics) {
        collaborators.diagnostics = std::make_shared<MetadataStore>();
    }
    if (!collaborators.workers) {
        collaborators.workers = thread_pool::makeIoPool("vpn-worker", settings.worker_min_threads, settings.worker_max_threads);
    }
    return Prepared{.settings = std::move(settings), .collaborators = std::move(collaborators)};
}

Context::Context(Settings settings) : Context(withDefaults(std::move(settings), Collaborators{})) {}

Context::Context(Settings settings, Collaborators collaborators) : Context(withDefaults(std::move(settings), std::move(collaborators))) {}

Context::Context(Prepared prepared)
    : _settings(std::move(prepared.settings)),                                                                                    //
      _diagnostics(std::move(prepared.collaborators.diagnostics)),                                                                //
      _workers(std::move(prepared.collaborators.workers)),                                                                        //
      _taskQueue(_workers, _callbackLoop),                                                                                        //
      _session(std::move(prepared.collaborators.session)),                                                                        //
      _resolver(std::move(prepared.collaborators.markerProbe), _session, std::move(prepared.collaborators.factories)),            //
      _publisher(_taskQueue, _diagnostics) {
    log::setLevel(_settings.log_level);

    if (_settings.install_source.has_value()) {
        MetadataPublisher::putSafely(*_diagnostics, diagnostics::key::kInstallSource, *_settings.install_source);
    }

    if (!_settings.enable_diagnostics) {
        log::debug(kComponent, "diagnostics disabled, backend is resolved on first use");
        return;
    }
    _publisher.attach(_backendFuture);
    _taskQueue.submit([this] { return _resolver.resolve(); }) //
        .thenAccept([this](const BackendPtr& backend) { completeFuture(backend); });
}

Context::~Context() {
    // in-flight continuations capture `this`: stop running them before the queue drains, pending ones are dropped
    _callbackLoop.stopThread();
    _taskQueue.waitUntilIdle();
}

BackendPtr Context::backend() {
    BackendPtr backend = _resolver.resolve();
    if (!_settings.enable_diagnostics) { // eager mode completes the future from the queued resolution only
        completeFuture(backend);
    }
    return backend;
}

void Context::completeFuture(const BackendPtr& backend) {
    if (_futureCompletionClaimed.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (_callbackLoop.isCallbackThread()) {
        _backendFuture.complete(backend);
        return;
    }
    _callbackLoop.post([this, backend] { _backendFuture.complete(backend); });
}

} // namespace vpn
