#pragma once

#include "task_handler.hpp"

class PluginSetupHandler : public TaskHandler {
public:
    explicit PluginSetupHandler(deployment::TaskServices &services) : TaskHandler(services) {
    }
    deployment::DeploymentResult handleRequest(deployment::Deployment &deployment) override;
};
