#include "prepare_run_handler.hpp"

deployment::DeploymentResult PrepareRunHandler::handleRequest(
    deployment::Deployment &deployment) {
    _services.environment.prepare();
    auto config = config::ResolvedConfig::resolve(*deployment.resolver);
    config.logParameters();
    deployment.config = std::make_shared<const config::ResolvedConfig>(std::move(config));
    return passOn(deployment);
}
