#include "config/resolved_config.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include <catch2/catch_all.hpp>
#include <sstream>

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN
static config::InputResolver resolverOf(
    std::shared_ptr<data::Map> params, std::shared_ptr<data::Map> deployment = nullptr) {
    std::shared_ptr<const deployment::DeploymentContext> context;
    if(deployment) {
        context = std::make_shared<const deployment::DeploymentContext>(deployment);
    }
    return config::InputResolver::standard(
        std::make_shared<config::ParameterSource>(params, nullptr, nullptr), context);
}

SCENARIO("Resolving a run configuration", "[config]") {
    GIVEN("Only the required inputs") {
        auto params = data::Map::of({{"release", "web"}, {"namespace", "prod"}, {"chart", "app"}});
        auto config = config::ResolvedConfig::resolve(resolverOf(params));
        THEN("Defaults apply") {
            REQUIRE(config.track == "stable");
            REQUIRE(config.release == "web");
            REQUIRE(config.chart == "/usr/src/charts/app");
            REQUIRE(config.helm == "helm3");
            REQUIRE(config.variant == helm::ToolVariant::Helm3);
            REQUIRE(config.atomic);
            REQUIRE_FALSE(config.dryRun);
            REQUIRE_FALSE(config.removeCanary);
            REQUIRE_FALSE(config.isRemove());
            REQUIRE(config.plugins.empty());
            REQUIRE(config.valueFiles.empty());
            REQUIRE(config.values.empty());
        }
    }

    GIVEN("A missing chart") {
        auto params = data::Map::of({{"release", "web"}, {"namespace", "prod"}});
        THEN("Resolution fails") {
            REQUIRE_THROWS_MATCHES(
                config::ResolvedConfig::resolve(resolverOf(params)),
                errors::MissingRequiredInputError,
                Catch::Matchers::Message("Input required and not supplied: chart"));
        }
    }

    GIVEN("A canary deployment requesting removal with a legacy helm") {
        auto params = data::Map::of({
            {"release", "web"},
            {"namespace", "prod"},
            {"chart", "stable/web"},
            {"helm", "helm"},
            {"atomic", "false"},
            {"dry-run", "true"},
            {"repo", "https://charts"},
            {"repo-alias", "charts"},
            {"repo-password", "hunter2"},
        });
        auto deployment = data::Map::of({
            {"task", "remove"},
            {"payload",
             data::Map::of({
                 {"track", "canary"},
                 {"remove_canary", true},
                 {"dry-run", false},
                 {"plugins", R"(["https://x/y"])"},
             })},
        });
        auto config = config::ResolvedConfig::resolve(resolverOf(params, deployment));
        THEN("Every field is resolved through the layers") {
            REQUIRE(config.track == "canary");
            REQUIRE(config.release == "web-canary");
            REQUIRE(config.appName == "web");
            REQUIRE(config.chart == "stable/web");
            REQUIRE(config.variant == helm::ToolVariant::Legacy);
            REQUIRE_FALSE(config.atomic);
            REQUIRE(config.isRemove());
            REQUIRE(config.removeCanary);
            REQUIRE(config.plugins.size() == 1);
            REQUIRE(config.repoAlias == "charts");
        }
        THEN("dry-run only honours the explicit parameter") {
            REQUIRE(config.dryRun);
        }

        WHEN("Parameters are logged at debug level") {
            std::stringstream out;
            auto manager = logging::LogManager::instance();
            manager->setStream(out);
            manager->setLevel(logging::Level::Debug);
            config.logParameters();
            manager->setLevel(logging::Level::Info);
            manager->resetStream();
            THEN("The repository password is masked") {
                REQUIRE_THAT(out.str(), ContainsSubstring("***"));
                REQUIRE_THAT(out.str(), !ContainsSubstring("hunter2"));
            }
        }
    }
}
// NOLINTEND
