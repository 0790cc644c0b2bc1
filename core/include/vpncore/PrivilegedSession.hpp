#ifndef VPNCORE_PRIVILEGED_SESSION_HPP
#define VPNCORE_PRIVILEGED_SESSION_HPP

#include <expected>
#include <string>
#include <string_view>

#include <vpncore/Error.hpp>
#include <vpncore/Export.hpp>

namespace vpn {

struct CommandResult {
    int         exitCode = 0;
    std::string output; ///< stdout of the command, trailing newline removed
};

/**
 * @brief long-lived connection to an elevated-privilege command execution context.
 *
 * `start()` is idempotent once it succeeded. Failures (missing binary, denied elevation, cancelled prompt, ...)
 * are reported as `Error` and are not distinguished further by the resolution core.
 * Commands are serialised by the implementation; callers may use one session from several threads.
 */
class VPNCORE_EXPORT PrivilegedSession {
public:
    virtual ~PrivilegedSession() = default;

    [[nodiscard]] virtual std::expected<void, Error>          start()                        = 0;
    [[nodiscard]] virtual std::expected<CommandResult, Error> run(std::string_view command) = 0;
    [[nodiscard]] virtual bool                                isRunning() const              = 0;
    virtual void                                              stop()                         = 0;
};

/// single-quotes `word` for a POSIX shell, embedded quotes become `'\''`
[[nodiscard]] inline std::string shellQuote(std::string_view word) {
    std::string quoted;
    quoted.reserve(word.size() + 2UZ);
    quoted.push_back('\'');
    for (char c : word) {
        if (c == '\'') {
            quoted.append("'\\''");
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

} // namespace vpn

#endif // VPNCORE_PRIVILEGED_SESSION_HPP
