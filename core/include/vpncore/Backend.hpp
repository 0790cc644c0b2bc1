#ifndef VPNCORE_BACKEND_HPP
#define VPNCORE_BACKEND_HPP

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <magic_enum.hpp>

#include <vpncore/Error.hpp>
#include <vpncore/Export.hpp>

namespace vpn {

class PrivilegedSession;

/**
 * @enum BackendKind the mutually-exclusive tunnel backend implementations.
 * - `KernelBackend`: drives the in-kernel tunnel engine through the privileged session (higher performance),
 * - `UserspaceBackend`: embedded userspace implementation that needs no elevated privileges.
 */
enum class BackendKind : char { KernelBackend, UserspaceBackend };

[[nodiscard]] constexpr std::string_view kindName(BackendKind kind) noexcept { return magic_enum::enum_name(kind); }

/**
 * @brief read-only capability surface shared by all backend variants.
 *
 * Exactly one instance exists per process once resolved; consumers hold it through `BackendPtr`.
 * `version()` may block (e.g. it may run a privileged command) and should be called off the callback thread.
 */
class VPNCORE_EXPORT Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual BackendKind                       kind() const noexcept = 0;
    [[nodiscard]] virtual std::expected<std::string, Error> version() const       = 0;

    [[nodiscard]] std::string_view name() const noexcept { return kindName(kind()); }
};

using BackendPtr = std::shared_ptr<const Backend>;

class VPNCORE_EXPORT KernelBackend final : public Backend {
    std::shared_ptr<PrivilegedSession> _session;
    std::filesystem::path              _modulePath;

public:
    KernelBackend(std::shared_ptr<PrivilegedSession> session, std::filesystem::path modulePath);

    [[nodiscard]] BackendKind                       kind() const noexcept override { return BackendKind::KernelBackend; }
    [[nodiscard]] std::expected<std::string, Error> version() const override;

    [[nodiscard]] const std::filesystem::path& modulePath() const noexcept { return _modulePath; }
};

class VPNCORE_EXPORT UserspaceBackend final : public Backend {
    std::string _version;

public:
    explicit UserspaceBackend(std::string version) noexcept : _version(std::move(version)) {}

    [[nodiscard]] BackendKind                       kind() const noexcept override { return BackendKind::UserspaceBackend; }
    [[nodiscard]] std::expected<std::string, Error> version() const override { return _version; }
};

/**
 * @brief construction seams of the two backend variants.
 *
 * `makeKernel` is called only after the privileged session started and may fail, `makeUserspace` is infallible.
 */
struct BackendFactories {
    std::function<std::expected<BackendPtr, Error>(const std::shared_ptr<PrivilegedSession>&)> makeKernel;
    std::function<BackendPtr()>                                                               makeUserspace;
};

[[nodiscard]] VPNCORE_EXPORT BackendFactories defaultBackendFactories(std::filesystem::path kernelModulePath, std::string userspaceVersion);

} // namespace vpn

template<>
struct fmt::formatter<vpn::BackendKind> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const vpn::BackendKind& kind, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(kind));
    }
};

#endif // VPNCORE_BACKEND_HPP
