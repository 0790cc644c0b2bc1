#include <vpncore/Backend.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <vpncore/PrivilegedSession.hpp>

namespace vpn {

KernelBackend::KernelBackend(std::shared_ptr<PrivilegedSession> session, std::filesystem::path modulePath) : _session(std::move(session)), _modulePath(std::move(modulePath)) {
    if (!_session) {
        throw vpn::exception("KernelBackend requires a privileged session");
    }
}

std::expected<std::string, Error> KernelBackend::version() const {
    const std::filesystem::path versionFile = _modulePath / "version";
    auto                        result      = _session->run(fmt::format("cat {}", shellQuote(versionFile.string())));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exitCode != 0 || result->output.empty()) {
        return std::unexpected(Error(fmt::format("unable to read kernel module version from {} (exit code {})", versionFile, result->exitCode)));
    }
    return result->output;
}

BackendFactories defaultBackendFactories(std::filesystem::path kernelModulePath, std::string userspaceVersion) {
    return BackendFactories{
        .makeKernel = [path = std::move(kernelModulePath)](const std::shared_ptr<PrivilegedSession>& session) -> std::expected<BackendPtr, Error> {
            if (!session || !session->isRunning()) {
                return std::unexpected(Error("privileged session is not running"));
            }
            try {
                return std::make_shared<const KernelBackend>(session, path);
            } catch (const vpn::exception& e) {
                return std::unexpected(Error(e));
            }
        },
        .makeUserspace = [version = std::move(userspaceVersion)]() -> BackendPtr { return std::make_shared<const UserspaceBackend>(version); },
    };
}

} // namespace vpn
