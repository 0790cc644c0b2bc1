#include <boost/ut.hpp>

#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <vpncore/RootShell.hpp>

using namespace std::string_literals;

const boost::ut::suite<"vpn::RootShell"> rootShellTests = [] {
    using namespace boost::ut;
    using namespace vpn;

    // a plain shell stands in for the elevation command so that the tests run unprivileged
    const RootShell::Options plainShell{.elevationCommand = "/bin/sh", .requireRoot = false};

    "command line splitting"_test = [] {
        expect(splitCommandLine("su") == std::vector<std::string>{"su"});
        expect(splitCommandLine("  sudo -n\tsh ") == std::vector<std::string>{"sudo", "-n", "sh"});
        expect(splitCommandLine("   ").empty());
    };

    "run before start is an Error"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(!shell.isRunning());
        expect(!shell.run("true").has_value());
    };

    "commands, output and exit codes"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(shell.start().has_value());
        expect(shell.isRunning());

        const auto echo = shell.run("echo hello");
        expect(echo.has_value());
        expect(eq(echo->exitCode, 0));
        expect(eq(echo->output, "hello"s));

        const auto multiLine = shell.run("printf 'a\\nb\\n'");
        expect(eq(multiLine->output, "a\nb"s));

        const auto noNewline = shell.run("printf 'partial'");
        expect(eq(noNewline->output, "partial"s));

        const auto failing = shell.run("false");
        expect(eq(failing->exitCode, 1));
        expect(failing->output.empty());

        const auto status = shell.run("(exit 7)");
        expect(eq(status->exitCode, 7));

        // the shell keeps its state between commands
        expect(shell.run("VPNCORE_TEST_VALUE=42").has_value());
        expect(eq(shell.run("echo $VPNCORE_TEST_VALUE")->output, "42"s));
    };

    "quoted arguments reach the shell verbatim"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(shell.start().has_value());
        const std::string hostile = "it's'; echo injected; '";
        const auto        echoed  = shell.run("printf '%s' " + shellQuote(hostile));
        expect(echoed.has_value());
        expect(eq(echoed->output, hostile));
    };

    "start is idempotent"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(shell.start().has_value());
        const auto pid = shell.run("echo $$");
        expect(shell.start().has_value());
        expect(eq(shell.run("echo $$")->output, pid->output)) << "same shell process";
    };

    "commands from several threads are serialised"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(shell.start().has_value());
        std::vector<std::thread> threads;
        std::vector<std::string> outputs(8UZ);
        for (std::size_t i = 0UZ; i < outputs.size(); ++i) {
            threads.emplace_back([&, i] {
                if (auto result = shell.run("echo " + std::to_string(i)); result) {
                    outputs[i] = result->output;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (std::size_t i = 0UZ; i < outputs.size(); ++i) {
            expect(eq(outputs[i], std::to_string(i)));
        }
    };

    "missing binary fails to start"_test = [] {
        RootShell shell(RootShell::Options{.elevationCommand = "/nonexistent/vpncore-su", .requireRoot = false});
        const auto started = shell.start();
        expect(!started.has_value());
        expect(!shell.isRunning());
    };

    "elevation that exits immediately fails to start"_test = [] {
        RootShell shell(RootShell::Options{.elevationCommand = "/bin/false", .requireRoot = false});
        expect(!shell.start().has_value());
        expect(!shell.isRunning());
    };

    "root check"_test = [] {
        RootShell  shell(RootShell::Options{.elevationCommand = "/bin/sh", .requireRoot = true});
        const auto started = shell.start();
        expect(started.has_value() == (::geteuid() == 0)) << "uid 0 is required";
    };

    "stop and shell exit"_test = [&plainShell] {
        RootShell shell(plainShell);
        expect(shell.start().has_value());
        shell.stop();
        expect(!shell.isRunning());
        expect(!shell.run("true").has_value());

        expect(shell.start().has_value()) << "restart after stop";
        expect(!shell.run("exit 0").has_value()) << "shell terminated while running the command";
        expect(!shell.isRunning());
    };
};

int main() { /* tests are statically executed */ }
