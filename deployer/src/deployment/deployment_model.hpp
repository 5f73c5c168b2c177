#pragma once
#include "config/input_resolver.hpp"
#include "config/resolved_config.hpp"
#include <functional>
#include <lookup_table.hpp>
#include <memory>
#include <string>

namespace deployment {

    enum class DeploymentStage { Pending, RepoSetup, PluginSetup, Deploying, Success, Failure };

    inline constexpr util::LookupTable<DeploymentStage, std::string_view, 6> STAGE_NAMES{
        DeploymentStage::Pending,
        "Pending",
        DeploymentStage::RepoSetup,
        "RepoSetup",
        DeploymentStage::PluginSetup,
        "PluginSetup",
        DeploymentStage::Deploying,
        "Deploying",
        DeploymentStage::Success,
        "Success",
        DeploymentStage::Failure,
        "Failure",
    };

    enum class DeploymentStatus { SUCCESSFUL, FAILED };

    struct DeploymentResult {
        DeploymentStatus deploymentStatus;
        std::string message;
        std::string errorKind;
    };

    using TransitionObserver = std::function<void(DeploymentStage from, DeploymentStage to)>;

    /**
     * State of one run as it passes through the task handlers.
     */
    struct Deployment {
        std::shared_ptr<const config::InputResolver> resolver;
        std::shared_ptr<const config::ResolvedConfig> config;
        DeploymentStage stage{DeploymentStage::Pending};
        TransitionObserver observer;

        void transition(DeploymentStage next);

        /**
         * The resolved configuration, available once the pending stage completed.
         */
        [[nodiscard]] const config::ResolvedConfig &getConfig() const;
    };
} // namespace deployment
