#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "platform_abstraction/linux/process_runner.hpp"
#include <catch2/catch_all.hpp>
#include <csignal>
#include <sstream>
#include <tuple>

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN
struct IgnoredChildSignal {
    void (*previous)(int){std::signal(SIGCHLD, SIG_IGN)};

    ~IgnoredChildSignal() {
        std::signal(SIGCHLD, previous);
    }
};

SCENARIO("Running external tools", "[ipc]") {
    auto env = std::make_shared<lifecycle::SysProperties>();
    env->put("PATH", "/usr/bin:/bin");
    env->put("DEPLOYER_TEST_VALUE", "from-snapshot");
    std::stringstream echoOut;
    std::stringstream echoErr;
    ipc::LinuxProcessRunner runner(env, echoOut, echoErr);

    GIVEN("A tool writing to stdout") {
        std::string captured;
        ipc::ExecOptions options{
            .outputListener = [&captured](std::string_view text) { captured.append(text); }};
        int exitCode = runner.execute("echo", {"hello", "$HOME", "a b"}, options);
        THEN("Arguments reach the tool unchanged and output is captured") {
            REQUIRE(exitCode == 0);
            REQUIRE(captured == "hello $HOME a b\n");
            REQUIRE(echoOut.str() == "hello $HOME a b\n");
        }
    }

    GIVEN("A tool reading the environment") {
        std::string captured;
        ipc::ExecOptions options{
            .outputListener = [&captured](std::string_view text) { captured.append(text); }};
        std::ignore = runner.execute(
            "/bin/sh", {"-c", "echo \"$DEPLOYER_TEST_VALUE\"; echo err >&2"}, options);
        THEN("The child sees the snapshot") {
            REQUIRE(captured == "from-snapshot\n");
        }
        THEN("Stderr is echoed but not captured") {
            REQUIRE(echoErr.str() == "err\n");
        }
    }

    GIVEN("A tool that fails") {
        THEN("A non-zero exit throws by default") {
            REQUIRE_THROWS_MATCHES(
                runner.execute("/bin/sh", {"-c", "exit 3"}),
                errors::ToolInvocationError,
                Catch::Matchers::Message("The process '/bin/sh' failed with exit code 3"));
        }
        THEN("Ignore-failure mode returns the exit code") {
            ipc::ExecOptions options{.ignoreReturnCode = true};
            REQUIRE(runner.execute("/bin/sh", {"-c", "exit 3"}, options) == 3);
        }
    }

    GIVEN("A tool that does not exist") {
        THEN("The invocation fails") {
            REQUIRE_THROWS_MATCHES(
                runner.execute("deployer-no-such-tool", {}),
                errors::ToolInvocationError,
                Catch::Matchers::MessageMatches(ContainsSubstring("deployer-no-such-tool")));
        }
    }

    GIVEN("A tool with a lot of output") {
        std::size_t received = 0;
        ipc::ExecOptions options{
            .outputListener = [&received](std::string_view text) { received += text.size(); }};
        std::ignore = runner.execute(
            "/bin/sh", {"-c", "i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done"},
            options);
        THEN("All of it is drained") {
            REQUIRE(received == 2000 * 11);
        }
    }

    GIVEN("A child that cannot be reaped") {
        // With SIGCHLD ignored the kernel reaps children itself and waitid fails
        IgnoredChildSignal ignored;
        WHEN("The tool runs in ignore-failure mode") {
            ipc::ExecOptions options{.ignoreReturnCode = true};
            THEN("The wait failure is reported as a tool invocation error") {
                REQUIRE_THROWS_MATCHES(
                    runner.execute("/bin/true", {}, options),
                    errors::ToolInvocationError,
                    Catch::Matchers::MessageMatches(
                        Catch::Matchers::StartsWith("Unable to wait for '/bin/true'")));
            }
        }
    }

    GIVEN("A command line carrying a password") {
        auto manager = logging::LogManager::instance();
        std::stringstream logged;
        manager->setStream(logged);
        std::ignore = runner.execute("echo", {"repo", "add", "--password=secret"});
        manager->resetStream();
        THEN("The logged command masks it") {
            REQUIRE_THAT(
                logged.str(), ContainsSubstring("[command]echo repo add --password=***"));
            REQUIRE_THAT(logged.str(), !ContainsSubstring("secret"));
        }
    }
}
// NOLINTEND
