#include "command_builder.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "naming.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.helm.CommandBuilder");

namespace helm {

    static bool present(const std::optional<std::string> &value) {
        return value.has_value() && !value->empty();
    }

    Args CommandBuilder::deleteCommand(
        ToolVariant variant, std::string_view ns, std::string_view release) {
        switch(variant) {
            case ToolVariant::Helm3:
                return {"delete", "-n", std::string{ns}, std::string{release}};
            case ToolVariant::Legacy:
                return {"delete", "--purge", std::string{release}};
        }
        return {};
    }

    Args CommandBuilder::upgradeCommand(const config::ResolvedConfig &config) {
        Args args{
            "upgrade",
            config.release,
            config.chart,
            "--install",
            "--wait",
            "--namespace=" + config.ns,
        };

        if(config.dryRun) {
            args.emplace_back("--dry-run");
        }
        if(!config.appName.empty()) {
            args.emplace_back("--set=app.name=" + config.appName);
        }
        if(present(config.version)) {
            args.emplace_back("--set=app.version=" + config.version.value());
        }
        if(present(config.chartVersion)) {
            args.emplace_back("--version=" + config.chartVersion.value());
        }
        if(present(config.timeout)) {
            args.emplace_back("--timeout=" + config.timeout.value());
        }

        for(const auto &file : config.valueFiles) {
            args.emplace_back("-f");
            args.emplace_back(file);
        }
        for(const auto &[key, value] : config.values.entries) {
            args.emplace_back("--set");
            args.emplace_back(key + "=" + config::renderSetValue(value));
        }
        if(config.values.expression.has_value()) {
            args.emplace_back("--set");
            args.emplace_back(config.values.expression.value());
        }

        // Canary releases are reached through the stable service, so the chart must not
        // create its own service or ingress.
        if(config.track == CANARY_TRACK) {
            args.emplace_back("--set=service.enabled=false");
            args.emplace_back("--set=ingress.enabled=false");
        }

        if(config.atomic) {
            args.emplace_back("--atomic");
        }
        return args;
    }

    std::vector<Args> CommandBuilder::repoCommands(const config::ResolvedConfig &config) {
        if(!present(config.repo)) {
            return {};
        }
        if(!present(config.repoAlias)) {
            LOG.atError("repo-setup").kv("repo", config.repo.value()).logAndThrow(
                errors::MissingRepoAliasError{});
        }
        Args add{"repo", "add", config.repoAlias.value(), config.repo.value()};
        if(present(config.repoUsername)) {
            add.emplace_back("--username=" + config.repoUsername.value());
        }
        if(present(config.repoPassword)) {
            add.emplace_back("--password=" + config.repoPassword.value());
        }
        return {add, Args{"repo", "update"}};
    }

    Args CommandBuilder::pluginInstallCommand(const config::PluginSpec &plugin) {
        Args args{"plugin", "install", plugin.url};
        if(present(plugin.version)) {
            args.emplace_back("--version");
            args.emplace_back(plugin.version.value());
        }
        return args;
    }
} // namespace helm
