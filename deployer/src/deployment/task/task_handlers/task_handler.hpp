#pragma once

#include "deployment/deployment_model.hpp"
#include "lifecycle/run_environment.hpp"
#include "platform_abstraction/abstract_process_runner.hpp"

namespace deployment {
    /**
     * Collaborators shared by every handler of a run.
     */
    struct TaskServices {
        ipc::ProcessRunner &runner;
        lifecycle::RunEnvironment &environment;
    };
} // namespace deployment

class TaskHandler {

private:
    TaskHandler *nextTaskHandler{};

protected:
    [[nodiscard]] virtual TaskHandler &getNextHandler() const {
        return *nextTaskHandler;
    }

    deployment::DeploymentResult passOn(deployment::Deployment &deployment) {
        if(nextTaskHandler == nullptr) {
            return deployment::DeploymentResult{deployment::DeploymentStatus::SUCCESSFUL};
        }
        return getNextHandler().handleRequest(deployment);
    }

public:
    deployment::TaskServices &_services;
    TaskHandler(const TaskHandler &) = delete;
    TaskHandler(TaskHandler &&) = delete;
    TaskHandler &operator=(const TaskHandler &) = delete;
    TaskHandler &operator=(TaskHandler &&) = delete;
    explicit TaskHandler(deployment::TaskServices &services) : _services(services){};
    virtual ~TaskHandler() = default;

    /**
     * Handle this stage and pass on to the next handler.
     * @throws errors::Error when the stage fails
     */
    virtual deployment::DeploymentResult handleRequest(deployment::Deployment &deployment) = 0;

    virtual void setNextHandler(TaskHandler &handler) {
        nextTaskHandler = &handler;
    }
};
