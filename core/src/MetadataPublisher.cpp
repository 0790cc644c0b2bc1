#include <vpncore/MetadataPublisher.hpp>

#include <exception>
#include <string>

#include <vpncore/Log.hpp>

namespace vpn {

namespace {
constexpr std::string_view kComponent = "MetadataPublisher";
}

MetadataPublisher::MetadataPublisher(SerialTaskQueue& queue, std::shared_ptr<DiagnosticsSink> sink) : _queue(queue), _sink(std::move(sink)) {
    if (!_sink) {
        throw vpn::exception("MetadataPublisher requires a diagnostics sink");
    }
}

void MetadataPublisher::attach(OneShotFuture<BackendPtr>& future) {
    future.onComplete([this](const BackendPtr& backend) { publish(backend); });
}

void MetadataPublisher::publish(BackendPtr backend) {
    if (!backend) {
        log::warning(kComponent, "no backend to publish");
        return;
    }
    _queue
        .submit([sink = _sink, backend = std::move(backend)] {
            putSafely(*sink, diagnostics::key::kBackend, backend->name());
            return backend;
        })
        .thenSubmit([sink = _sink](const BackendPtr& resolved) -> Result<std::string> {
            auto version = resolved->version();
            if (version) {
                putSafely(*sink, diagnostics::key::kBackendVersion, *version);
            }
            return version;
        })
        .onComplete([](const Result<std::string>& version) {
            if (!version) {
                log::warning(kComponent, "backend version unavailable: {}", version.error());
            }
        });
}

bool MetadataPublisher::putSafely(DiagnosticsSink& sink, std::string_view key, std::string_view value) {
    try {
        if (auto stored = sink.putMetadata(key, value); !stored) {
            log::warning(kComponent, "failed to record '{}': {}", key, stored.error());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log::warning(kComponent, "failed to record '{}': {}", key, e.what());
        return false;
    }
}

} // namespace vpn
