#pragma once

#include "task_handler.hpp"

/**
 * Pending stage: prepares the run environment and resolves the configuration. Every required
 * input is checked here, before any tool is invoked.
 */
class PrepareRunHandler : public TaskHandler {
public:
    explicit PrepareRunHandler(deployment::TaskServices &services) : TaskHandler(services) {
    }
    deployment::DeploymentResult handleRequest(deployment::Deployment &deployment) override;
};
