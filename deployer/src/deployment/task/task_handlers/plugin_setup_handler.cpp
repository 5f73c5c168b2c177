#include "plugin_setup_handler.hpp"
#include "helm/plugin_installer.hpp"

deployment::DeploymentResult PluginSetupHandler::handleRequest(
    deployment::Deployment &deployment) {
    deployment.transition(deployment::DeploymentStage::PluginSetup);
    const auto &config = deployment.getConfig();
    helm::PluginInstaller installer(
        _services.runner, config.helm, _services.environment.pluginDirectory());
    installer.install(config.plugins);
    return passOn(deployment);
}
