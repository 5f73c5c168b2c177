#pragma once
#include "deployment/task/default_deployment_task.hpp"

// For testing, instead of passing to the next handler, pass to a dummy handler that will return
// success state
class DummySuccessHandler : public TaskHandler {
public:
    int calls{0};

    explicit DummySuccessHandler(deployment::TaskServices &services) : TaskHandler(services) {
    }
    deployment::DeploymentResult handleRequest(deployment::Deployment &) override {
        ++calls;
        return deployment::DeploymentResult{deployment::DeploymentStatus::SUCCESSFUL};
    }
};
