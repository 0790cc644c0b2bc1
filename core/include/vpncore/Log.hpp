#ifndef VPNCORE_LOG_HPP
#define VPNCORE_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <magic_enum.hpp>

namespace vpn {
namespace time {
[[nodiscard]] inline std::string getIsoTime(std::chrono::system_clock::time_point timePoint = std::chrono::system_clock::now()) noexcept {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - secs).count();
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", fmt::gmtime(std::chrono::system_clock::to_time_t(secs)), ms); // ms-precision ISO time-format
}
} // namespace time

namespace log {

enum class Level : char { Debug, Info, Warning, Error, Off };

namespace detail {
inline std::atomic<Level>& threshold() noexcept {
    static std::atomic<Level> level{Level::Info};
    return level;
}
} // namespace detail

inline void setLevel(Level level) noexcept { detail::threshold().store(level, std::memory_order_relaxed); }

[[nodiscard]] inline Level level() noexcept { return detail::threshold().load(std::memory_order_relaxed); }

[[nodiscard]] inline bool isEnabled(Level msgLevel) noexcept { return msgLevel >= level() && msgLevel != Level::Off; }

[[nodiscard]] inline std::optional<Level> parseLevel(std::string_view name) noexcept { return magic_enum::enum_cast<Level>(name, magic_enum::case_insensitive); }

/**
 * Writes a single line `<iso-time> <LEVEL> [<component>] <message>` to stderr.
 * The line is formatted before the write so that concurrent writers do not interleave.
 */
template<typename... Args>
void print(Level msgLevel, std::string_view component, fmt::format_string<Args...> formatString, Args&&... args) {
    if (!isEnabled(msgLevel)) {
        return;
    }
    const std::string line = fmt::format("{} {:<7} [{}] {}\n", time::getIsoTime(), magic_enum::enum_name(msgLevel), component, fmt::format(formatString, std::forward<Args>(args)...));
    std::fputs(line.c_str(), stderr);
}

template<typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> formatString, Args&&... args) {
    print(Level::Debug, component, formatString, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::string_view component, fmt::format_string<Args...> formatString, Args&&... args) {
    print(Level::Info, component, formatString, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(std::string_view component, fmt::format_string<Args...> formatString, Args&&... args) {
    print(Level::Warning, component, formatString, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::string_view component, fmt::format_string<Args...> formatString, Args&&... args) {
    print(Level::Error, component, formatString, std::forward<Args>(args)...);
}

} // namespace log
} // namespace vpn

#endif // VPNCORE_LOG_HPP
