#include <vpncore/BackendResolver.hpp>

#include <exception>

#include <vpncore/Log.hpp>

namespace vpn {

namespace {
constexpr std::string_view kComponent = "BackendResolver";
}

BackendResolver::BackendResolver(KernelMarkerProbe markerProbe, std::shared_ptr<PrivilegedSession> session, BackendFactories factories) //
    : _markerProbe(std::move(markerProbe)), _session(std::move(session)), _factories(std::move(factories)) {
    if (!_markerProbe || !_factories.makeKernel || !_factories.makeUserspace) {
        throw vpn::exception("BackendResolver requires a marker probe and both backend factories");
    }
}

BackendPtr BackendResolver::resolve() {
    std::scoped_lock resolveLock(_resolveMutex); // late callers block here while the winner probes
    if (_state.load(std::memory_order_acquire) == ResolutionState::Resolved) {
        std::scoped_lock lock(_resultMutex);
        return _backend;
    }
    _state.store(ResolutionState::Resolving, std::memory_order_release);

    ResolutionReport outcome;
    BackendPtr       backend = probe(outcome);
    log::info(kComponent, "using {} ({})", backend->kind(), outcome.reason == FallbackReason::None ? std::string_view{"preferred"} : magic_enum::enum_name(outcome.reason));
    {
        std::scoped_lock lock(_resultMutex);
        _backend = backend;
        _report  = std::move(outcome);
        _state.store(ResolutionState::Resolved, std::memory_order_release);
    }
    return backend;
}

BackendPtr BackendResolver::resolvedBackend() const {
    std::scoped_lock lock(_resultMutex);
    return _state.load(std::memory_order_relaxed) == ResolutionState::Resolved ? _backend : nullptr;
}

std::optional<ResolutionReport> BackendResolver::report() const {
    std::scoped_lock lock(_resultMutex);
    if (_state.load(std::memory_order_relaxed) != ResolutionState::Resolved) {
        return std::nullopt;
    }
    return _report;
}

BackendPtr BackendResolver::probe(ResolutionReport& outcome) {
    _probeCount.fetch_add(1UZ, std::memory_order_acq_rel);

    const auto fallback = [this, &outcome](FallbackReason reason, std::string detail) -> BackendPtr {
        if (reason != FallbackReason::KernelMarkerAbsent) {
            log::warning(kComponent, "kernel backend unavailable ({}): {}", reason, detail);
        }
        outcome = ResolutionReport{.kind = BackendKind::UserspaceBackend, .reason = reason, .detail = std::move(detail)};
        return _factories.makeUserspace();
    };

    if (!_markerProbe()) {
        return fallback(FallbackReason::KernelMarkerAbsent, {});
    }
    if (!_session) {
        return fallback(FallbackReason::PrivilegedSessionFailed, "no privileged session configured");
    }

    try {
        if (auto started = _session->start(); !started) {
            return fallback(FallbackReason::PrivilegedSessionFailed, started.error().message);
        }
    } catch (const std::exception& e) {
        return fallback(FallbackReason::PrivilegedSessionFailed, e.what());
    }

    try {
        auto kernel = _factories.makeKernel(_session);
        if (!kernel) {
            return fallback(FallbackReason::KernelBackendFailed, kernel.error().message);
        }
        if (*kernel == nullptr) {
            return fallback(FallbackReason::KernelBackendFailed, "kernel backend factory returned null");
        }
        outcome = ResolutionReport{.kind = BackendKind::KernelBackend, .reason = FallbackReason::None, .detail = {}};
        return std::move(*kernel);
    } catch (const std::exception& e) {
        return fallback(FallbackReason::KernelBackendFailed, e.what());
    }
}

} // namespace vpn
