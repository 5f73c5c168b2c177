#pragma once

#include "deployment/task/task_handlers/deploy_handler.hpp"
#include "deployment/task/task_handlers/plugin_setup_handler.hpp"
#include "deployment/task/task_handlers/prepare_run_handler.hpp"
#include "deployment/task/task_handlers/repo_setup_handler.hpp"
#include "errors/error_base.hpp"
#include "status/status_reporter.hpp"

/**
 * Runs one deployment: Pending, RepoSetup, PluginSetup, Deploying, then Success or Failure.
 * The reporter is told about the start and about exactly one outcome.
 */
class DefaultDeploymentTask {
private:
    std::shared_ptr<status::StatusReporter> _reporter;
    PrepareRunHandler prepareRunHandler;
    RepoSetupHandler repoSetupHandler;
    PluginSetupHandler pluginSetupHandler;
    DeployHandler deployHandler;

    deployment::DeploymentResult fail(
        deployment::Deployment &deployment, const errors::Error &error);

public:
    DefaultDeploymentTask(
        deployment::TaskServices &services, std::shared_ptr<status::StatusReporter> reporter);

    deployment::DeploymentResult handleTaskExecution(deployment::Deployment &deployment);
};
