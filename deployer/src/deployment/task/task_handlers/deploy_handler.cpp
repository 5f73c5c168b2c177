#include "deploy_handler.hpp"
#include "errors/errors.hpp"
#include "helm/command_builder.hpp"
#include "helm/naming.hpp"
#include "logging/log_manager.hpp"
#include <tuple>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.deployment.DeployHandler");

deployment::DeploymentResult DeployHandler::handleRequest(deployment::Deployment &deployment) {
    deployment.transition(deployment::DeploymentStage::Deploying);
    const auto &config = deployment.getConfig();
    ipc::ExecOptions ignoreFailure{.ignoreReturnCode = true};

    LOG.atDebug("environment")
        .kv("KUBECONFIG",
            _services.environment.environment()->getOr(lifecycle::SysProperties::KUBECONFIG, ""))
        .log();

    if(config.removeCanary) {
        auto canary = config.appName + "-" + std::string(helm::CANARY_TRACK);
        LOG.atDebug("remove-canary").kv("release", canary).log("removing canary");
        std::ignore = _services.runner.execute(
            config.helm,
            helm::CommandBuilder::deleteCommand(config.variant, config.ns, canary),
            ignoreFailure);
    }

    if(config.isRemove()) {
        int exitCode = _services.runner.execute(
            config.helm,
            helm::CommandBuilder::deleteCommand(config.variant, config.ns, config.release),
            ignoreFailure);
        if(exitCode != 0) {
            LOG.atError("remove")
                .kv("release", config.release)
                .kv("exitCode", exitCode)
                .logAndThrow(errors::ToolInvocationError(
                    "The process '" + config.helm + "' failed with exit code "
                        + std::to_string(exitCode),
                    exitCode));
        }
        return passOn(deployment);
    }

    std::ignore =
        _services.runner.execute(config.helm, helm::CommandBuilder::upgradeCommand(config));
    return passOn(deployment);
}
