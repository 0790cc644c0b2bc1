#ifndef VPNCORE_METADATA_PUBLISHER_HPP
#define VPNCORE_METADATA_PUBLISHER_HPP

#include <memory>
#include <string_view>

#include <vpncore/Backend.hpp>
#include <vpncore/Diagnostics.hpp>
#include <vpncore/Export.hpp>
#include <vpncore/OneShotFuture.hpp>
#include <vpncore/SerialTaskQueue.hpp>

namespace vpn {

/**
 * @brief records the resolved backend's identity with the diagnostics sink.
 *
 * Once the backend future completes, one task stores `backend` = kind name, and a second one, chained behind it on
 * the same queue, stores `backendVersion` = `backend->version()`.
 * Sink or version failures are logged and dropped; they never influence backend resolution.
 */
class VPNCORE_EXPORT MetadataPublisher {
    SerialTaskQueue&                 _queue;
    std::shared_ptr<DiagnosticsSink> _sink;

public:
    MetadataPublisher(SerialTaskQueue& queue, std::shared_ptr<DiagnosticsSink> sink);

    void attach(OneShotFuture<BackendPtr>& future);

    /// submits the two metadata tasks for `backend`
    void publish(BackendPtr backend);

    /// single metadata write, failures are logged, @return whether the sink accepted the value
    static bool putSafely(DiagnosticsSink& sink, std::string_view key, std::string_view value);
};

} // namespace vpn

#endif // VPNCORE_METADATA_PUBLISHER_HPP
