#ifndef VPNCORE_DIAGNOSTICS_HPP
#define VPNCORE_DIAGNOSTICS_HPP

#include <cstddef>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <vpncore/Error.hpp>
#include <vpncore/Export.hpp>
#include <vpncore/Settings.hpp>

namespace vpn {

namespace diagnostics::key {
inline constexpr std::string_view kBackend        = "backend";
inline constexpr std::string_view kBackendVersion = "backendVersion";
inline constexpr std::string_view kInstallSource  = "installSource";
} // namespace diagnostics::key

/**
 * @brief key/value metadata channel of the crash/diagnostics reporter.
 *
 * Implementations may fail; callers treat failures as non-fatal.
 */
class VPNCORE_EXPORT DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    [[nodiscard]] virtual std::expected<void, Error> putMetadata(std::string_view key, std::string_view value) = 0;
};

/// thread-safe in-memory sink, the default attached to a `Context`
class VPNCORE_EXPORT MetadataStore final : public DiagnosticsSink {
    mutable std::mutex                 _mutex;
    property_map                       _metadata;
    std::map<std::string, std::size_t> _putCounts;

public:
    [[nodiscard]] std::expected<void, Error> putMetadata(std::string_view key, std::string_view value) override;

    [[nodiscard]] property_map               snapshot() const;
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::size_t                putCount(std::string_view key) const;
};

} // namespace vpn

#endif // VPNCORE_DIAGNOSTICS_HPP
