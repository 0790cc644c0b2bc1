#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <variant>

#include <fmt/format.h>

#include <vpncore/Context.hpp>
#include <vpncore/Diagnostics.hpp>
#include <vpncore/Settings.hpp>

// usage: vpncore [key=value ...], e.g. `vpncore "elevation_command=sudo -n sh" log_level=Debug`
int main(int argc, char** argv) {
    auto arguments = vpn::parseKeyValueArguments(argc, argv);
    if (!arguments) {
        fmt::print(stderr, "invalid arguments: {}\n", arguments.error());
        return EXIT_FAILURE;
    }
    auto settings = vpn::Settings::fromPropertyMap(*arguments);
    if (!settings) {
        fmt::print(stderr, "invalid settings: {}\n", settings.error());
        return EXIT_FAILURE;
    }

    auto diagnostics = std::make_shared<vpn::MetadataStore>();
    int  exitCode    = EXIT_SUCCESS;
    {
        vpn::Context context(*settings, vpn::Context::Collaborators{.diagnostics = diagnostics});
        // the main thread acts as callback thread
        vpn::BackendPtr backend = context.backend();
        auto            version = backend->version();
        fmt::print("backend: {}\n", backend->kind());
        if (version) {
            fmt::print("version: {}\n", *version);
        } else {
            fmt::print("version: <unavailable> ({})\n", version.error());
            exitCode = EXIT_FAILURE;
        }
        if (auto report = context.resolver().report(); report && report->reason != vpn::FallbackReason::None) {
            fmt::print("kernel backend rejected: {} {}\n", report->reason, report->detail);
        }
        if (settings->enable_diagnostics) {
            // resolution, backend name and backend version tasks
            const bool published = context.callbackLoop().processUntil([&context] { return context.taskQueue().numTasksExecuted() >= 3UZ && context.callbackLoop().numPending() == 0UZ; });
            if (!published) {
                fmt::print(stderr, "timed out waiting for the backend metadata\n");
            }
        }
    }

    for (const auto& [key, value] : diagnostics->snapshot()) {
        if (const auto* text = std::get_if<std::string>(&value)) {
            fmt::print("metadata: {} = {}\n", key, *text);
        }
    }
    return exitCode;
}
