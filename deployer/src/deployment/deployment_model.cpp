#include "deployment_model.hpp"
#include "logging/log_manager.hpp"
#include <stdexcept>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.deployment.Deployment");

namespace deployment {

    void Deployment::transition(DeploymentStage next) {
        auto from = stage;
        stage = next;
        LOG.atInfo("stage")
            .kv("from", std::string(STAGE_NAMES.lookupOr(from, "")))
            .kv("to", std::string(STAGE_NAMES.lookupOr(next, "")))
            .log();
        if(observer) {
            observer(from, next);
        }
    }

    const config::ResolvedConfig &Deployment::getConfig() const {
        if(!config) {
            throw std::logic_error("Deployment configuration has not been resolved");
        }
        return *config;
    }
} // namespace deployment
