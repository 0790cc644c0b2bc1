#ifndef VPNCORE_KERNEL_MODULE_PROBE_HPP
#define VPNCORE_KERNEL_MODULE_PROBE_HPP

#include <filesystem>
#include <functional>
#include <system_error>

#include <vpncore/Log.hpp>

namespace vpn {

/// presence check of the in-kernel tunnel engine, `true` iff the marker path exists
using KernelMarkerProbe = std::function<bool()>;

struct KernelModuleProbe {
    std::filesystem::path markerPath = "/sys/module/wireguard";

    [[nodiscard]] bool operator()() const {
        std::error_code ec;
        const bool      present = std::filesystem::exists(markerPath, ec);
        if (ec) {
            log::debug("KernelModuleProbe", "cannot stat '{}': {}", markerPath.string(), ec.message());
            return false;
        }
        return present;
    }
};

} // namespace vpn

#endif // VPNCORE_KERNEL_MODULE_PROBE_HPP
