#ifndef VPNCORE_BACKEND_RESOLVER_HPP
#define VPNCORE_BACKEND_RESOLVER_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <magic_enum.hpp>

#include <vpncore/Backend.hpp>
#include <vpncore/Export.hpp>
#include <vpncore/KernelModuleProbe.hpp>
#include <vpncore/PrivilegedSession.hpp>

namespace vpn {

/**
 * @enum ResolutionState monotonic life-cycle of a `BackendResolver`:
 * `Unresolved` -> `Resolving` -> `Resolved`, the last being terminal.
 */
enum class ResolutionState : char { Unresolved, Resolving, Resolved };

/// why the kernel path was abandoned (if it was)
enum class FallbackReason : char { None, KernelMarkerAbsent, PrivilegedSessionFailed, KernelBackendFailed };

struct ResolutionReport {
    BackendKind    kind   = BackendKind::UserspaceBackend;
    FallbackReason reason = FallbackReason::None;
    std::string    detail; ///< error text of the rejected kernel path, empty otherwise
};

/**
 * @brief decides once per process which backend to use and memoises the decision.
 *
 * Decision: if the kernel marker is present, the privileged session is started and the kernel backend built;
 * any failure on that path is logged and swallowed and the (infallible) userspace backend is used instead.
 * There is no retry: the outcome of the first resolution is final.
 *
 * `resolve()` is safe to call from any thread: the first caller probes, concurrent callers block on the same mutex
 * until the decision is memoised and then return the identical instance.
 */
class VPNCORE_EXPORT BackendResolver {
    KernelMarkerProbe                  _markerProbe;
    std::shared_ptr<PrivilegedSession> _session;
    BackendFactories                   _factories;

    std::mutex                   _resolveMutex; // held for the whole probe
    mutable std::mutex           _resultMutex;  // guards the published result only, never held while probing
    std::atomic<ResolutionState> _state{ResolutionState::Unresolved};
    BackendPtr                   _backend;
    ResolutionReport             _report;
    std::atomic_size_t           _probeCount = 0UZ;

public:
    BackendResolver(KernelMarkerProbe markerProbe, std::shared_ptr<PrivilegedSession> session, BackendFactories factories);

    BackendResolver(const BackendResolver&)            = delete;
    BackendResolver& operator=(const BackendResolver&) = delete;

    /// blocking; never returns null
    [[nodiscard]] BackendPtr resolve();

    [[nodiscard]] ResolutionState                 state() const noexcept { return _state.load(std::memory_order_acquire); }
    [[nodiscard]] BackendPtr                      resolvedBackend() const; ///< non-blocking peek, null unless `Resolved`
    [[nodiscard]] std::optional<ResolutionReport> report() const;
    [[nodiscard]] std::size_t                     probeCount() const noexcept { return _probeCount.load(std::memory_order_acquire); }

private:
    BackendPtr probe(ResolutionReport& outcome);
};

} // namespace vpn

template<>
struct fmt::formatter<vpn::ResolutionState> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const vpn::ResolutionState& state, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(state));
    }
};

template<>
struct fmt::formatter<vpn::FallbackReason> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const vpn::FallbackReason& reason, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(reason));
    }
};

#endif // VPNCORE_BACKEND_RESOLVER_HPP
