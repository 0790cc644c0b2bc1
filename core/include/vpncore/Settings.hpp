#ifndef VPNCORE_SETTINGS_HPP
#define VPNCORE_SETTINGS_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <pmtv/pmt.hpp>

#include <vpncore/Error.hpp>
#include <vpncore/Log.hpp>

namespace vpn {

using property_map = pmtv::map_t;

namespace settings::key {
inline constexpr std::string_view kEnableDiagnostics = "enable_diagnostics";
inline constexpr std::string_view kKernelModulePath  = "kernel_module_path";
inline constexpr std::string_view kElevationCommand  = "elevation_command";
inline constexpr std::string_view kRequireRoot       = "require_root";
inline constexpr std::string_view kUserspaceVersion  = "userspace_version";
inline constexpr std::string_view kInstallSource     = "install_source";
inline constexpr std::string_view kLogLevel          = "log_level";
inline constexpr std::string_view kWorkerMinThreads  = "worker_min_threads";
inline constexpr std::string_view kWorkerMaxThreads  = "worker_max_threads";
} // namespace settings::key

/**
 * @brief process-wide configuration of the backend-resolution core.
 *
 * Built once from a `property_map` (e.g. parsed from the command line or handed over by the embedding
 * application) and immutable afterwards. Every key is optional; the defaults match a stock Linux host.
 */
struct Settings {
    bool                       enable_diagnostics = true;                    ///< resolve eagerly at start-up and publish backend metadata
    std::string                kernel_module_path = "/sys/module/wireguard"; ///< presence marker of the in-kernel tunnel engine
    std::string                elevation_command  = "su";                    ///< binary started by the privileged session
    bool                       require_root       = true;                    ///< privileged session must report uid 0
    std::string                userspace_version  = "0.0.20191012";          ///< version reported by the userspace backend
    std::optional<std::string> install_source;                               ///< optional diagnostics tag
    log::Level                 log_level          = log::Level::Info;
    std::uint32_t              worker_min_threads = 1U;
    std::uint32_t              worker_max_threads = 8U;

    [[nodiscard]] static std::expected<Settings, Error> fromPropertyMap(const property_map& map, std::source_location location = std::source_location::current());

    [[nodiscard]] property_map toPropertyMap() const;
};

/// parses `key=value` tokens; values `true`/`false` become bool, integral values become std::int64_t, anything else stays a string
[[nodiscard]] std::expected<property_map, Error> parseKeyValueArguments(int argc, const char* const* argv, int firstArgument = 1);

} // namespace vpn

#endif // VPNCORE_SETTINGS_HPP
