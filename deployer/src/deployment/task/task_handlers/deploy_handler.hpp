#pragma once

#include "task_handler.hpp"

/**
 * Deploying stage: optional canary removal, then either delete or upgrade of the release.
 */
class DeployHandler : public TaskHandler {
public:
    explicit DeployHandler(deployment::TaskServices &services) : TaskHandler(services) {
    }
    deployment::DeploymentResult handleRequest(deployment::Deployment &deployment) override;
};
