#include <vpncore/Settings.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <string>

namespace vpn {

namespace {

template<typename T>
std::expected<const T*, Error> lookup(const property_map& map, std::string_view key, std::source_location location) {
    const auto it = map.find(std::string(key));
    if (it == map.end()) {
        return nullptr;
    }
    if (const T* value = std::get_if<T>(&it->second)) { // std::get_if instead of std::get and try-catch block
        return value;
    }
    return std::unexpected(Error{fmt::format("setting '{}' has the wrong type", key), location});
}

std::expected<std::uint32_t, Error> threadCount(const property_map& map, std::string_view key, std::uint32_t defaultValue, std::source_location location) {
    const auto it = map.find(std::string(key));
    if (it == map.end()) {
        return defaultValue;
    }
    std::int64_t value = 0;
    if (const auto* v64 = std::get_if<std::int64_t>(&it->second)) {
        value = *v64;
    } else if (const auto* v32 = std::get_if<std::int32_t>(&it->second)) {
        value = *v32;
    } else if (const auto* u32 = std::get_if<std::uint32_t>(&it->second)) {
        value = *u32;
    } else {
        return std::unexpected(Error{fmt::format("setting '{}' must be an integer", key), location});
    }
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::unexpected(Error{fmt::format("setting '{}' out of range: {}", key, value), location});
    }
    return static_cast<std::uint32_t>(value);
}

constexpr std::array kKnownKeys{settings::key::kEnableDiagnostics, settings::key::kKernelModulePath, settings::key::kElevationCommand, settings::key::kRequireRoot, //
    settings::key::kUserspaceVersion, settings::key::kInstallSource, settings::key::kLogLevel, settings::key::kWorkerMinThreads, settings::key::kWorkerMaxThreads};

} // namespace

std::expected<Settings, Error> Settings::fromPropertyMap(const property_map& map, std::source_location location) {
    for (const auto& [key, _] : map) {
        if (std::ranges::find(kKnownKeys, std::string_view{key}) == kKnownKeys.end()) {
            return std::unexpected(Error{fmt::format("unknown setting '{}'", key), location});
        }
    }

    Settings parsed;
    const auto assign = [&]<typename T>(std::string_view key, auto& field) -> std::expected<void, Error> {
        auto value = lookup<T>(map, key, location);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (*value != nullptr) {
            field = **value;
        }
        return {};
    };

    if (auto r = assign.template operator()<bool>(settings::key::kEnableDiagnostics, parsed.enable_diagnostics); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = assign.template operator()<bool>(settings::key::kRequireRoot, parsed.require_root); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = assign.template operator()<std::string>(settings::key::kKernelModulePath, parsed.kernel_module_path); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = assign.template operator()<std::string>(settings::key::kElevationCommand, parsed.elevation_command); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = assign.template operator()<std::string>(settings::key::kUserspaceVersion, parsed.userspace_version); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = assign.template operator()<std::string>(settings::key::kInstallSource, parsed.install_source); !r) {
        return std::unexpected(r.error());
    }

    auto levelName = lookup<std::string>(map, settings::key::kLogLevel, location);
    if (!levelName) {
        return std::unexpected(levelName.error());
    }
    if (*levelName != nullptr) {
        const auto level = log::parseLevel(**levelName);
        if (!level) {
            return std::unexpected(Error{fmt::format("unknown log level '{}'", **levelName), location});
        }
        parsed.log_level = *level;
    }

    auto minThreads = threadCount(map, settings::key::kWorkerMinThreads, parsed.worker_min_threads, location);
    if (!minThreads) {
        return std::unexpected(minThreads.error());
    }
    auto maxThreads = threadCount(map, settings::key::kWorkerMaxThreads, parsed.worker_max_threads, location);
    if (!maxThreads) {
        return std::unexpected(maxThreads.error());
    }
    if (*minThreads > *maxThreads) {
        return std::unexpected(Error{fmt::format("worker_min_threads ({}) must be <= worker_max_threads ({})", *minThreads, *maxThreads), location});
    }
    parsed.worker_min_threads = *minThreads;
    parsed.worker_max_threads = *maxThreads;

    if (parsed.kernel_module_path.empty() || parsed.elevation_command.empty()) {
        return std::unexpected(Error{"kernel_module_path and elevation_command must not be empty", location});
    }
    return parsed;
}

property_map Settings::toPropertyMap() const {
    property_map map{
        {std::string(settings::key::kEnableDiagnostics), enable_diagnostics},                                   //
        {std::string(settings::key::kKernelModulePath), kernel_module_path},                                    //
        {std::string(settings::key::kElevationCommand), elevation_command},                                     //
        {std::string(settings::key::kRequireRoot), require_root},                                               //
        {std::string(settings::key::kUserspaceVersion), userspace_version},                                     //
        {std::string(settings::key::kLogLevel), std::string(magic_enum::enum_name(log_level))},                 //
        {std::string(settings::key::kWorkerMinThreads), static_cast<std::int64_t>(worker_min_threads)},         //
        {std::string(settings::key::kWorkerMaxThreads), static_cast<std::int64_t>(worker_max_threads)},         //
    };
    if (install_source) {
        map.emplace(std::string(settings::key::kInstallSource), *install_source);
    }
    return map;
}

std::expected<property_map, Error> parseKeyValueArguments(int argc, const char* const* argv, int firstArgument) {
    property_map map;
    for (int i = firstArgument; i < argc; ++i) {
        const std::string_view token{argv[i]};
        const auto             separator = token.find('=');
        if (separator == std::string_view::npos || separator == 0UZ) {
            return std::unexpected(Error{fmt::format("argument '{}' is not of the form key=value", token)});
        }
        const std::string      key{token.substr(0, separator)};
        const std::string_view value = token.substr(separator + 1);

        if (value == "true" || value == "false") {
            map.insert_or_assign(key, value == "true");
            continue;
        }
        std::int64_t number = 0;
        if (const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number); ec == std::errc{} && ptr == value.data() + value.size() && !value.empty()) {
            map.insert_or_assign(key, number);
            continue;
        }
        map.insert_or_assign(key, std::string(value));
    }
    return map;
}

} // namespace vpn
