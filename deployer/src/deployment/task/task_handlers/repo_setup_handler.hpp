#pragma once

#include "task_handler.hpp"

class RepoSetupHandler : public TaskHandler {
public:
    explicit RepoSetupHandler(deployment::TaskServices &services) : TaskHandler(services) {
    }
    deployment::DeploymentResult handleRequest(deployment::Deployment &deployment) override;
};
