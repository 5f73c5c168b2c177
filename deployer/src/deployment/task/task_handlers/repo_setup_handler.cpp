#include "repo_setup_handler.hpp"
#include "helm/command_builder.hpp"
#include "logging/log_manager.hpp"
#include <tuple>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.deployment.RepoSetupHandler");

deployment::DeploymentResult RepoSetupHandler::handleRequest(
    deployment::Deployment &deployment) {
    deployment.transition(deployment::DeploymentStage::RepoSetup);
    const auto &config = deployment.getConfig();
    auto commands = helm::CommandBuilder::repoCommands(config);
    if(!commands.empty()) {
        LOG.atDebug("repo-add")
            .kv("repo", config.repo.value_or(""))
            .kv("alias", config.repoAlias.value_or(""))
            .log("adding custom repository");
    }
    for(const auto &args : commands) {
        std::ignore = _services.runner.execute(config.helm, args);
    }
    return passOn(deployment);
}
