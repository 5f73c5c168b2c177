#include "default_deployment_task.hpp"
#include "logging/log_manager.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.deployment.DefaultDeploymentTask");

DefaultDeploymentTask::DefaultDeploymentTask(
    deployment::TaskServices &services, std::shared_ptr<status::StatusReporter> reporter)
    : _reporter(std::make_shared<status::NonFatalStatusReporter>(std::move(reporter))),
      prepareRunHandler(services), repoSetupHandler(services), pluginSetupHandler(services),
      deployHandler(services) {
    prepareRunHandler.setNextHandler(repoSetupHandler);
    repoSetupHandler.setNextHandler(pluginSetupHandler);
    pluginSetupHandler.setNextHandler(deployHandler);
}

deployment::DeploymentResult DefaultDeploymentTask::handleTaskExecution(
    deployment::Deployment &deployment) {
    _reporter->notify(status::DeploymentState::Pending);
    try {
        auto result = prepareRunHandler.handleRequest(deployment);
        deployment.transition(deployment::DeploymentStage::Success);
        _reporter->notify(status::DeploymentState::Success);
        return result;
    } catch(const errors::Error &err) {
        return fail(deployment, err);
    } catch(const std::exception &err) {
        return fail(deployment, errors::Error::of(err));
    }
}

deployment::DeploymentResult DefaultDeploymentTask::fail(
    deployment::Deployment &deployment, const errors::Error &error) {
    LOG.atError("deployment-failed")
        .kv("stage", std::string(deployment::STAGE_NAMES.lookupOr(deployment.stage, "")))
        .cause(error)
        .log(error.what());
    deployment.transition(deployment::DeploymentStage::Failure);
    _reporter->notify(status::DeploymentState::Failure);
    return deployment::DeploymentResult{
        deployment::DeploymentStatus::FAILED, error.what(), error.kind()};
}
