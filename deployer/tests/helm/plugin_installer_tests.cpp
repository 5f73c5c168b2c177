#include "errors/errors.hpp"
#include "helm/plugin_installer.hpp"
#include "recording_runner.hpp"
#include "test_tools.hpp"
#include <catch2/catch_all.hpp>

using Catch::Matchers::Equals;

// NOLINTBEGIN
SCENARIO("Installing helm plugins", "[helm][plugins]") {
    test::TempDir tempDir;
    test::RecordingRunner runner;
    auto pluginDir = tempDir.getDir() / "helm" / "plugins";
    helm::PluginInstaller installer(runner, "helm3", pluginDir);

    GIVEN("Two plugins") {
        std::vector<config::PluginSpec> plugins{
            {"https://github.com/databus23/helm-diff", "3.1.3"},
            {"https://github.com/x/y/", std::nullopt},
        };

        WHEN("Both installs succeed") {
            runner.outputs["rm"] = "removed";
            installer.install(plugins);
            THEN("Each install is followed by removal of its residual directory") {
                REQUIRE(runner.calls.size() == 4);
                REQUIRE(runner.calls[0].binary == "helm3");
                REQUIRE_THAT(
                    runner.calls[0].args,
                    Equals(std::vector<std::string>{
                        "plugin",
                        "install",
                        "https://github.com/databus23/helm-diff",
                        "--version",
                        "3.1.3"}));
                REQUIRE(runner.calls[1].binary == "rm");
                REQUIRE(runner.calls[1].ignoreReturnCode);
                REQUIRE_THAT(
                    runner.calls[1].args,
                    Equals(std::vector<std::string>{
                        "-rf", (pluginDir / "https-github.com-databus23-helm-diff").string()}));
                REQUIRE(runner.calls[3].args[1] == (pluginDir / "https-github.com-x-y").string());
            }
        }

        WHEN("The first install fails") {
            runner.exitCodes["plugin"] = 1;
            THEN("The failure message is carried verbatim and nothing else runs") {
                REQUIRE_THROWS_MATCHES(
                    installer.install(plugins),
                    errors::PluginInstallError,
                    Catch::Matchers::Message("The process 'helm3' failed with exit code 1"));
                REQUIRE(runner.calls.size() == 1);
            }
        }

        WHEN("Residual cleanup fails") {
            runner.exitCodes["rm"] = 1;
            installer.install(plugins);
            THEN("The failure is ignored and all plugins are installed") {
                REQUIRE(runner.argsOf("helm3").size() == 2);
                REQUIRE(runner.argsOf("rm").size() == 2);
            }
        }
    }

    GIVEN("A plugin without a url") {
        std::vector<config::PluginSpec> plugins{{"", std::nullopt}};
        WHEN("Installing") {
            installer.install(plugins);
            THEN("It is skipped") {
                REQUIRE(runner.calls.empty());
            }
        }
    }

    GIVEN("A plugin") {
        config::PluginSpec plugin{"https://github.com/x/y/", std::nullopt};
        THEN("Its residual directory is under the plugin directory") {
            REQUIRE(installer.residualDirectory(plugin) == pluginDir / "https-github.com-x-y");
        }
    }
}
// NOLINTEND
