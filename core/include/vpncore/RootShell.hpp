#ifndef VPNCORE_ROOT_SHELL_HPP
#define VPNCORE_ROOT_SHELL_HPP

#include <atomic>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include <vpncore/Error.hpp>
#include <vpncore/Export.hpp>
#include <vpncore/PrivilegedSession.hpp>

namespace vpn {

/**
 * @brief `PrivilegedSession` backed by an elevated interactive shell (by default `su`).
 *
 * The shell is spawned once and kept alive; its stdin/stdout are connected to a socket pair. Each command is followed
 * by a unique end marker carrying the exit status, so that the output of consecutive commands can be separated.
 * The child is killed when the owning process dies (PR_SET_PDEATHSIG).
 */
class VPNCORE_EXPORT RootShell final : public PrivilegedSession {
public:
    struct Options {
        std::string elevationCommand = "su"; ///< command line, split at blanks, resolved through PATH
        bool        requireRoot      = true; ///< verify that the shell runs with uid 0
    };

private:
    static std::atomic<unsigned> _instanceCounter;

    Options            _options;
    std::string        _marker;
    mutable std::mutex _mutex;
    mutable pid_t      _pid = -1; // reset once the child has been reaped
    int                _fd  = -1;
    std::string        _readBuffer;

public:
    explicit RootShell(Options options);
    ~RootShell() override;

    RootShell(const RootShell&)            = delete;
    RootShell& operator=(const RootShell&) = delete;

    [[nodiscard]] std::expected<void, Error>          start() override;
    [[nodiscard]] std::expected<CommandResult, Error> run(std::string_view command) override;
    [[nodiscard]] bool                                isRunning() const override;
    void                                              stop() override;

    [[nodiscard]] const Options& options() const noexcept { return _options; }

private:
    std::expected<void, Error>          spawnLocked();
    std::expected<CommandResult, Error> runLocked(std::string_view command);
    std::expected<void, Error>          writeAllLocked(std::string_view data);
    std::expected<std::string, Error>   readUntilMarkerLocked();
    bool                                reapLocked(bool block, int* status = nullptr) const;
    void                                closeLocked();
};

[[nodiscard]] VPNCORE_EXPORT std::vector<std::string> splitCommandLine(std::string_view commandLine);

} // namespace vpn

#endif // VPNCORE_ROOT_SHELL_HPP
