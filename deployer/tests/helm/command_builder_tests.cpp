#include "errors/errors.hpp"
#include "helm/command_builder.hpp"
#include <catch2/catch_all.hpp>

using Catch::Matchers::Equals;

// NOLINTBEGIN
static config::ResolvedConfig baseConfig() {
    config::ResolvedConfig config;
    config.appName = "web";
    config.release = "web";
    config.ns = "prod";
    config.chart = "/usr/src/charts/app";
    return config;
}

SCENARIO("Delete commands per tool variant", "[helm]") {
    GIVEN("A helm3 binary") {
        THEN("The namespace is passed explicitly") {
            REQUIRE_THAT(
                helm::CommandBuilder::deleteCommand(helm::ToolVariant::Helm3, "prod", "web"),
                Equals(helm::Args{"delete", "-n", "prod", "web"}));
        }
    }
    GIVEN("A legacy binary") {
        THEN("The release is purged") {
            REQUIRE_THAT(
                helm::CommandBuilder::deleteCommand(helm::ToolVariant::Legacy, "prod", "web"),
                Equals(helm::Args{"delete", "--purge", "web"}));
        }
    }
    GIVEN("The helm input") {
        THEN("Only helm3 selects the helm3 dialect") {
            REQUIRE(helm::toolVariant("helm3") == helm::ToolVariant::Helm3);
            REQUIRE(helm::toolVariant("helm") == helm::ToolVariant::Legacy);
            REQUIRE(helm::toolVariant("/usr/bin/helm3") == helm::ToolVariant::Legacy);
        }
    }
}

SCENARIO("Upgrade command synthesis", "[helm]") {
    GIVEN("A minimal configuration") {
        auto config = baseConfig();
        WHEN("Atomic is left at its default") {
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("Only the base arguments, app name and atomic are emitted") {
                REQUIRE_THAT(
                    args,
                    Equals(helm::Args{
                        "upgrade",
                        "web",
                        "/usr/src/charts/app",
                        "--install",
                        "--wait",
                        "--namespace=prod",
                        "--set=app.name=web",
                        "--atomic"}));
            }
        }
        WHEN("Atomic is disabled") {
            config.atomic = false;
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("No atomic flag is emitted") {
                REQUIRE(std::find(args.begin(), args.end(), "--atomic") == args.end());
            }
        }
        WHEN("Optional fields are present but empty") {
            config.version = "";
            config.chartVersion = "";
            config.timeout = "";
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("Their flags are not emitted") {
                REQUIRE(args.size() == 8);
            }
        }
    }

    GIVEN("A fully populated canary configuration") {
        auto config = baseConfig();
        config.track = "canary";
        config.release = "web-canary";
        config.dryRun = true;
        config.version = "1.4.0";
        config.chartVersion = "0.9.1";
        config.timeout = "5m0s";
        config.valueFiles = {"base.yml", "prod.yml"};
        config.values = config::decodeValues(data::Value{R"({"a":1,"b":"two"})"});

        WHEN("The upgrade command is built") {
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("Flags appear in the fixed order") {
                REQUIRE_THAT(
                    args,
                    Equals(helm::Args{
                        "upgrade",
                        "web-canary",
                        "/usr/src/charts/app",
                        "--install",
                        "--wait",
                        "--namespace=prod",
                        "--dry-run",
                        "--set=app.name=web",
                        "--set=app.version=1.4.0",
                        "--version=0.9.1",
                        "--timeout=5m0s",
                        "-f",
                        "base.yml",
                        "-f",
                        "prod.yml",
                        "--set",
                        "a=1",
                        "--set",
                        "b=two",
                        "--set=service.enabled=false",
                        "--set=ingress.enabled=false",
                        "--atomic"}));
            }
        }
    }

    GIVEN("Values that are not a JSON object") {
        auto config = baseConfig();
        config.atomic = false;
        config.values = config::decodeValues(data::Value{"image.tag=v2,replicas=3"});
        WHEN("The upgrade command is built") {
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("The raw text is passed as one set expression") {
                REQUIRE(args.size() == 9);
                REQUIRE(args[7] == "--set");
                REQUIRE(args[8] == "image.tag=v2,replicas=3");
            }
        }
    }

    GIVEN("Nested and non-string values") {
        auto config = baseConfig();
        config.atomic = false;
        config.values = config::decodeValues(
            data::Value{R"({"enabled":true,"ratio":0.5,"tags":["a","b"],"img":{"tag":"x"}})"});
        WHEN("The upgrade command is built") {
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("Scalars use their JSON text and containers compact JSON") {
                REQUIRE(args[8] == "enabled=true");
                REQUIRE(args[10] == "ratio=0.5");
                REQUIRE(args[12] == R"(tags=["a","b"])");
                REQUIRE(args[14] == R"(img={"tag":"x"})");
            }
        }
    }

    GIVEN("A null value and a whole-number double") {
        auto config = baseConfig();
        config.atomic = false;
        config.values = config::decodeValues(data::Value{R"({"ingress.tls":null,"a":1.0})"});
        WHEN("The upgrade command is built") {
            auto args = helm::CommandBuilder::upgradeCommand(config);
            THEN("Null is passed as null and the double without a fraction") {
                REQUIRE_THAT(
                    std::vector<std::string>(args.begin() + 7, args.end()),
                    Equals(helm::Args{"--set", "ingress.tls=null", "--set", "a=1"}));
            }
        }
    }
}

SCENARIO("Repository commands", "[helm]") {
    GIVEN("No repository") {
        auto config = baseConfig();
        THEN("Nothing is emitted") {
            REQUIRE(helm::CommandBuilder::repoCommands(config).empty());
        }
    }
    GIVEN("A repository without an alias") {
        auto config = baseConfig();
        config.repo = "https://charts.example.com";
        THEN("The alias is required") {
            REQUIRE_THROWS_MATCHES(
                helm::CommandBuilder::repoCommands(config),
                errors::MissingRepoAliasError,
                Catch::Matchers::Message(
                    "repo alias is required when you are setting a repository"));
        }
    }
    GIVEN("A repository with alias and credentials") {
        auto config = baseConfig();
        config.repo = "https://charts.example.com";
        config.repoAlias = "example";
        config.repoUsername = "bot";
        config.repoPassword = "s3cret";
        WHEN("The commands are built") {
            auto commands = helm::CommandBuilder::repoCommands(config);
            THEN("repo add carries the credentials and is followed by repo update") {
                REQUIRE(commands.size() == 2);
                REQUIRE_THAT(
                    commands[0],
                    Equals(helm::Args{
                        "repo",
                        "add",
                        "example",
                        "https://charts.example.com",
                        "--username=bot",
                        "--password=s3cret"}));
                REQUIRE_THAT(commands[1], Equals(helm::Args{"repo", "update"}));
            }
        }
    }
}

SCENARIO("Plugin install commands", "[helm]") {
    GIVEN("A plugin with a version") {
        config::PluginSpec plugin{"https://github.com/databus23/helm-diff", "3.1.3"};
        THEN("The version is passed as a separate argument") {
            REQUIRE_THAT(
                helm::CommandBuilder::pluginInstallCommand(plugin),
                Equals(helm::Args{
                    "plugin",
                    "install",
                    "https://github.com/databus23/helm-diff",
                    "--version",
                    "3.1.3"}));
        }
    }
    GIVEN("A plugin without a version") {
        config::PluginSpec plugin{"https://github.com/x/y", std::nullopt};
        THEN("Only the url is passed") {
            REQUIRE_THAT(
                helm::CommandBuilder::pluginInstallCommand(plugin),
                Equals(helm::Args{"plugin", "install", "https://github.com/x/y"}));
        }
    }
}
// NOLINTEND
