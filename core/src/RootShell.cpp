#include <vpncore/RootShell.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include <vpncore/Log.hpp>

namespace vpn {

namespace {
constexpr std::string_view kComponent         = "RootShell";
constexpr int              kExitGraceAttempts = 50;

std::string trimTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

Error errnoError(std::string_view what, int error, std::source_location location = std::source_location::current()) { return Error(fmt::format("{}: {}", what, std::strerror(error)), location); }
} // namespace

std::atomic<unsigned> RootShell::_instanceCounter{0U};

std::vector<std::string> splitCommandLine(std::string_view commandLine) {
    std::vector<std::string> args;
    std::string              current;
    for (char c : commandLine) {
        if (c == ' ' || c == '\t') {
            if (!current.empty()) {
                args.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        args.push_back(std::move(current));
    }
    return args;
}

RootShell::RootShell(Options options) : _options(std::move(options)), _marker(fmt::format("__VPNCORE_END_{}_{}__", ::getpid(), _instanceCounter.fetch_add(1U))) {}

RootShell::~RootShell() { stop(); }

std::expected<void, Error> RootShell::start() {
    std::scoped_lock lock(_mutex);
    if (_pid > 0 && !reapLocked(false)) {
        return {};
    }
    closeLocked();

    if (auto spawned = spawnLocked(); !spawned) {
        return spawned;
    }

    // first round trip: the elevation prompt either succeeded or the shell is gone
    auto probe = runLocked("true");
    if (!probe) {
        closeLocked();
        return std::unexpected(probe.error());
    }

    if (_options.requireRoot) {
        auto uid = runLocked("id -u");
        if (!uid) {
            closeLocked();
            return std::unexpected(uid.error());
        }
        if (uid->exitCode != 0 || uid->output != "0") {
            closeLocked();
            return std::unexpected(Error(fmt::format("elevated shell '{}' does not run as root (uid: '{}')", _options.elevationCommand, uid->output)));
        }
    }
    log::info(kComponent, "elevated shell '{}' started (pid {})", _options.elevationCommand, _pid);
    return {};
}

std::expected<CommandResult, Error> RootShell::run(std::string_view command) {
    std::scoped_lock lock(_mutex);
    if (_pid <= 0 || _fd < 0) {
        return std::unexpected(Error("elevated shell is not running"));
    }
    return runLocked(command);
}

bool RootShell::isRunning() const {
    std::scoped_lock lock(_mutex);
    return _pid > 0 && !reapLocked(false);
}

void RootShell::stop() {
    std::scoped_lock lock(_mutex);
    if (_pid > 0 && _fd >= 0) {
        constexpr std::string_view exitCommand = "exit\n";
        // the shell may already be gone, a failing write is fine here
        [[maybe_unused]] auto written = ::send(_fd, exitCommand.data(), exitCommand.size(), MSG_NOSIGNAL);
    }
    closeLocked();
}

std::expected<void, Error> RootShell::spawnLocked() {
    const std::vector<std::string> args = splitCommandLine(_options.elevationCommand);
    if (args.empty()) {
        return std::unexpected(Error("empty elevation command"));
    }
    std::vector<char*> argv;
    argv.reserve(args.size() + 1UZ);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        return std::unexpected(errnoError("socketpair failed", errno));
    }

    const pid_t parentPid = ::getpid();
    const pid_t pid       = ::fork();
    if (pid < 0) {
        const int error = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(errnoError("fork failed", error));
    }

    if (pid == 0) {
        // child: only async-signal-safe calls until exec
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parentPid) {
            _exit(127);
        }
        if (::dup2(fds[1], STDIN_FILENO) < 0 || ::dup2(fds[1], STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    ::close(fds[1]);
    _pid = pid;
    _fd  = fds[0];
    _readBuffer.clear();
    log::debug(kComponent, "spawned '{}' (pid {})", _options.elevationCommand, pid);
    return {};
}

std::expected<CommandResult, Error> RootShell::runLocked(std::string_view command) {
    const std::string script = fmt::format("{}\n__vpncore_rc=$?; echo; echo \"{} $__vpncore_rc\"\n", command, _marker);
    if (auto written = writeAllLocked(script); !written) {
        return std::unexpected(written.error());
    }
    auto received = readUntilMarkerLocked();
    if (!received) {
        return std::unexpected(received.error());
    }

    // received: "<output>\n<marker> <rc>" (the echo before the marker guarantees the newline)
    const std::size_t markerPos = received->rfind(_marker);
    CommandResult     result;
    const std::string status = received->substr(markerPos + _marker.size());
    try {
        result.exitCode = std::stoi(status);
    } catch (const std::exception& e) {
        return std::unexpected(Error(fmt::format("malformed exit status '{}' from elevated shell: {}", status, e.what())));
    }
    std::string output = received->substr(0UZ, markerPos);
    if (!output.empty() && output.back() == '\n') {
        output.pop_back(); // the separating echo
    }
    result.output = trimTrailingNewlines(std::move(output));
    return result;
}

std::expected<void, Error> RootShell::writeAllLocked(std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            reapLocked(false);
            return std::unexpected(errnoError(fmt::format("writing to elevated shell '{}' failed", _options.elevationCommand), error));
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return {};
}

std::expected<std::string, Error> RootShell::readUntilMarkerLocked() {
    char buffer[4096];
    for (;;) {
        if (const auto markerPos = _readBuffer.find(_marker); markerPos != std::string::npos) {
            if (const auto lineEnd = _readBuffer.find('\n', markerPos); lineEnd != std::string::npos) {
                std::string message = _readBuffer.substr(0UZ, lineEnd);
                _readBuffer.erase(0UZ, lineEnd + 1UZ);
                return message;
            }
        }

        const ssize_t n = ::recv(_fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errnoError("reading from elevated shell failed", errno));
        }
        if (n == 0) {
            int status = 0;
            reapLocked(true, &status);
            const int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
            return std::unexpected(Error(fmt::format("elevated shell '{}' terminated (exit code {})", _options.elevationCommand, exitCode)));
        }
        _readBuffer.append(buffer, static_cast<std::size_t>(n));
    }
}

bool RootShell::reapLocked(bool block, int* status) const {
    if (_pid <= 0) {
        return true;
    }
    int         localStatus = 0;
    const pid_t result      = ::waitpid(_pid, &localStatus, block ? 0 : WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result < 0 && errno == EINTR) {
        return reapLocked(block, status);
    }
    if (status != nullptr) {
        *status = localStatus;
    }
    _pid = -1;
    return true;
}

void RootShell::closeLocked() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
    if (_pid > 0) {
        // closing stdin lets a well-behaved shell exit, anything still alive after the grace period is killed
        for (int attempt = 0; attempt < kExitGraceAttempts; ++attempt) {
            if (reapLocked(false)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (_pid > 0) {
            ::kill(_pid, SIGKILL);
            reapLocked(true);
        }
    }
    _readBuffer.clear();
}

} // namespace vpn
