#ifndef VPNCORE_ERROR_HPP
#define VPNCORE_ERROR_HPP

#include <chrono>
#include <exception>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/chrono.h>
#include <fmt/format.h>

template<>
struct fmt::formatter<std::source_location> {
    char presentation = 's';

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (presentation) {
        case 's': return fmt::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return fmt::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return fmt::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

namespace vpn {

/**
 * @brief thrown for programming errors (e.g. completing a OneShotFuture twice or an invalid configuration
 * handed to a constructor). Recoverable runtime conditions are reported as `std::expected<T, vpn::Error>` instead.
 */
struct exception : public std::exception {
    std::string                           message;
    std::source_location                  sourceLocation;
    std::chrono::system_clock::time_point errorTime = std::chrono::system_clock::now();

    exception(std::string_view msg = "unknown exception", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{} at {}:{}", message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

struct Error {
    std::string                           message;
    std::source_location                  sourceLocation;
    std::chrono::system_clock::time_point errorTime = std::chrono::system_clock::now();

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current(), //
        std::chrono::system_clock::time_point time = std::chrono::system_clock::now()) noexcept                    //
        : message(msg), sourceLocation(location), errorTime(time) {}

    explicit Error(const std::exception& ex, std::source_location location = std::source_location::current()) noexcept : Error(ex.what(), location) {}

    explicit Error(const vpn::exception& ex) noexcept : Error(ex.message, ex.sourceLocation, ex.errorTime) {}

    [[nodiscard]] std::string srcLoc() const noexcept { return fmt::format("{}", sourceLocation); }
    [[nodiscard]] std::string methodName() const noexcept { return {sourceLocation.function_name()}; }
    [[nodiscard]] std::string isoTime() const noexcept {
        return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}",                     // ms-precision ISO time-format
            fmt::localtime(std::chrono::system_clock::to_time_t(errorTime)), //
            std::chrono::duration_cast<std::chrono::milliseconds>(errorTime.time_since_epoch()).count() % 1000);
    }
};

static_assert(std::is_default_constructible_v<Error>);
static_assert(!std::is_trivially_copyable_v<Error>); // because of the usage of std::string

template<typename T>
using Result = std::expected<T, Error>;

namespace detail {
template<typename T>
struct is_result : std::false_type {};

template<typename T>
struct is_result<std::expected<T, Error>> : std::true_type {};
} // namespace detail

/// `Result<U>` -> `U`, any other `T` -> `T`
template<typename T>
struct result_value {
    using type = T;
};

template<typename T>
struct result_value<std::expected<T, Error>> {
    using type = T;
};

template<typename T>
using result_value_t = typename result_value<std::remove_cvref_t<T>>::type;

template<typename T>
concept ResultLike = detail::is_result<std::remove_cvref_t<T>>::value;

} // namespace vpn

template<>
struct fmt::formatter<vpn::Error> {
    char presentation = 's';

    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 'f' || *it == 't' || *it == 's')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const vpn::Error& err, FormatContext& ctx) const -> decltype(ctx.out()) {
        switch (presentation) {
        case 't': return fmt::format_to(ctx.out(), "{}: {:t}: {} in method: {}", err.isoTime(), err.sourceLocation, err.message, err.sourceLocation.function_name());
        case 'f': return fmt::format_to(ctx.out(), "{:t}: {} in method: {}", err.sourceLocation, err.message, err.sourceLocation.function_name());
        case 's':
        default: return fmt::format_to(ctx.out(), "{:t}: {}", err.sourceLocation, err.message);
        }
    }
};

#endif // VPNCORE_ERROR_HPP
