#ifndef VPNCORE_THREAD_NAME_HPP
#define VPNCORE_THREAD_NAME_HPP

#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#if !defined(_WIN32) && (defined(__unix__) || defined(__unix) || (defined(__APPLE__) && defined(__MACH__))) // UNIX-style OS
#include <unistd.h>
#if defined(_POSIX_VERSION)
#include <pthread.h>
#endif
#endif

namespace vpn::thread_pool::thread {

constexpr std::size_t THREAD_MAX_NAME_LENGTH = 16;
constexpr int         THREAD_UNINITIALISED   = 1;
constexpr int         THREAD_ERANGE          = 34;

class thread_exception : public std::error_category {
    using std::error_category::error_category;

public:
    constexpr thread_exception() : std::error_category() {};

    const char* name() const noexcept override { return "thread_exception"; };

    std::string message(int errorCode) const override {
        switch (errorCode) {
        case THREAD_UNINITIALISED: return "thread uninitialised";
        case THREAD_ERANGE: return fmt::format("length of the thread name exceeds the allowed limit THREAD_MAX_NAME_LENGTH = '{}'", THREAD_MAX_NAME_LENGTH);
        default: return fmt::format("unknown threading error code {}", errorCode);
        }
    };
};

template<class type>
concept thread_type = std::is_same_v<type, std::thread> || std::is_same_v<type, std::jthread>;

#if defined(_POSIX_VERSION) && not defined(__APPLE__)
namespace detail {
inline pthread_t getPosixHandler(thread_type auto&... t) noexcept {
    if constexpr (sizeof...(t) > 0) {
        return [](auto& first) { return static_cast<pthread_t>(first.native_handle()); }(t...);
    } else {
        return pthread_self();
    }
}
} // namespace detail

inline std::string getThreadName(thread_type auto&... thread) {
    const pthread_t handle = detail::getPosixHandler(thread...);
    if (handle == 0U) {
        throw std::system_error(THREAD_UNINITIALISED, thread_exception(), "getThreadName(thread_type)");
    }
    char threadName[THREAD_MAX_NAME_LENGTH];
    if (int rc = pthread_getname_np(handle, threadName, THREAD_MAX_NAME_LENGTH); rc != 0) {
        throw std::system_error(rc, thread_exception(), "getThreadName(thread_type)");
    }
    return std::string{threadName, strnlen(threadName, THREAD_MAX_NAME_LENGTH)};
}

/// names longer than the kernel limit of 15 characters are truncated
inline void setThreadName(std::string_view threadName, thread_type auto&... thread) {
    const pthread_t handle = detail::getPosixHandler(thread...);
    if (handle == 0U) {
        throw std::system_error(THREAD_UNINITIALISED, thread_exception(), fmt::format("setThreadName({}, thread_type)", threadName));
    }
    const std::string truncated{threadName.substr(0, THREAD_MAX_NAME_LENGTH - 1)};
    if (int rc = pthread_setname_np(handle, truncated.c_str()); rc != 0) {
        throw std::system_error(rc, thread_exception(), fmt::format("setThreadName({}) - error code '{}'", threadName, rc));
    }
}
#else
inline std::string getThreadName(thread_type auto&... /*thread*/) { return "unknown thread name"; }

inline void setThreadName(std::string_view /*threadName*/, thread_type auto&... /*thread*/) {}
#endif

} // namespace vpn::thread_pool::thread

#endif // VPNCORE_THREAD_NAME_HPP
