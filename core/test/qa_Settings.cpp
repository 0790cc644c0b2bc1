#include <boost/ut.hpp>

#include <cstdint>
#include <string>
#include <variant>

#include <vpncore/Settings.hpp>

using namespace std::string_literals;

const boost::ut::suite<"vpn::Settings"> settingsTests = [] {
    using namespace boost::ut;
    using namespace vpn;

    "defaults"_test = [] {
        const auto settings = Settings::fromPropertyMap({});
        expect(settings.has_value());
        expect(settings->enable_diagnostics);
        expect(eq(settings->kernel_module_path, "/sys/module/wireguard"s));
        expect(eq(settings->elevation_command, "su"s));
        expect(settings->require_root);
        expect(eq(settings->userspace_version, "0.0.20191012"s));
        expect(!settings->install_source.has_value());
        expect(settings->log_level == log::Level::Info);
        expect(eq(settings->worker_min_threads, 1U));
        expect(eq(settings->worker_max_threads, 8U));
    };

    "typed overrides"_test = [] {
        const property_map map{
            {"enable_diagnostics", false},
            {"kernel_module_path", "/tmp/module"s},
            {"elevation_command", "sudo -n sh"s},
            {"require_root", false},
            {"install_source", "store"s},
            {"log_level", "debug"s},
            {"worker_min_threads", std::int64_t{2}},
            {"worker_max_threads", std::int32_t{4}},
        };
        const auto settings = Settings::fromPropertyMap(map);
        expect(settings.has_value());
        expect(!settings->enable_diagnostics);
        expect(eq(settings->kernel_module_path, "/tmp/module"s));
        expect(eq(settings->elevation_command, "sudo -n sh"s));
        expect(!settings->require_root);
        expect(settings->install_source == std::optional<std::string>("store"));
        expect(settings->log_level == log::Level::Debug);
        expect(eq(settings->worker_min_threads, 2U));
        expect(eq(settings->worker_max_threads, 4U));
    };

    "invalid input is reported as Error"_test = [] {
        expect(!Settings::fromPropertyMap({{"unknown_key", true}}).has_value());
        expect(!Settings::fromPropertyMap({{"enable_diagnostics", "yes"s}}).has_value());
        expect(!Settings::fromPropertyMap({{"log_level", "verbose"s}}).has_value());
        expect(!Settings::fromPropertyMap({{"worker_min_threads", std::int64_t{0}}}).has_value());
        expect(!Settings::fromPropertyMap({{"worker_max_threads", "many"s}}).has_value());
        expect(!Settings::fromPropertyMap({{"worker_min_threads", std::int64_t{8}}, {"worker_max_threads", std::int64_t{2}}}).has_value());
        expect(!Settings::fromPropertyMap({{"elevation_command", ""s}}).has_value());

        const auto error = Settings::fromPropertyMap({{"unknown_key", true}});
        expect(error.error().message.find("unknown_key") != std::string::npos);
    };

    "property map round trip keeps every value"_test = [] {
        Settings original;
        original.enable_diagnostics = false;
        original.install_source     = "github";
        original.log_level          = log::Level::Error;
        original.worker_max_threads = 3U;

        const auto restored = Settings::fromPropertyMap(original.toPropertyMap());
        expect(restored.has_value());
        expect(!restored->enable_diagnostics);
        expect(restored->install_source == std::optional<std::string>("github"));
        expect(restored->log_level == log::Level::Error);
        expect(eq(restored->worker_max_threads, 3U));
    };
};

const boost::ut::suite<"vpn::parseKeyValueArguments"> argumentTests = [] {
    using namespace boost::ut;
    using namespace vpn;

    "typed values"_test = [] {
        const char* argv[] = {"vpncore", "enable_diagnostics=false", "worker_max_threads=4", "elevation_command=sudo -n sh", "install_source=a=b"};
        const auto  map    = parseKeyValueArguments(5, argv);
        expect(map.has_value());
        expect(std::get<bool>(map->at("enable_diagnostics")) == false);
        expect(std::get<std::int64_t>(map->at("worker_max_threads")) == 4);
        expect(eq(std::get<std::string>(map->at("elevation_command")), "sudo -n sh"s));
        expect(eq(std::get<std::string>(map->at("install_source")), "a=b"s));

        const auto settings = Settings::fromPropertyMap(*map);
        expect(settings.has_value());
        expect(eq(settings->worker_max_threads, 4U));
    };

    "malformed arguments"_test = [] {
        const char* noSeparator[] = {"vpncore", "verbose"};
        expect(!parseKeyValueArguments(2, noSeparator).has_value());
        const char* emptyKey[] = {"vpncore", "=value"};
        expect(!parseKeyValueArguments(2, emptyKey).has_value());
    };

    "log level names"_test = [] {
        expect(log::parseLevel("WARNING") == std::optional<log::Level>(log::Level::Warning));
        expect(log::parseLevel("off") == std::optional<log::Level>(log::Level::Off));
        expect(!log::parseLevel("chatty").has_value());
        expect(!log::isEnabled(log::Level::Off));
    };
};

int main() { /* tests are statically executed */ }
