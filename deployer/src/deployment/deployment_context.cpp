#include "deployment_context.hpp"
#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.deployment.DeploymentContext");

namespace deployment {

    static std::shared_ptr<data::Map> decodePayload(const data::Value &raw) {
        if(raw.isMap()) {
            return raw.getMap();
        }
        if(raw.isString() && !raw.getString().empty()) {
            try {
                auto decoded = conv::JsonHelper::parse(raw.getString());
                if(decoded.isMap()) {
                    return decoded.getMap();
                }
            } catch(const errors::JsonParseError &err) {
                LOG.atWarn("payload-decode").cause(err).log();
            }
        }
        return std::make_shared<data::Map>();
    }

    DeploymentContext::DeploymentContext(const std::shared_ptr<data::Map> &deployment)
        : _deployment(deployment ? deployment : std::make_shared<data::Map>()),
          _payload(decodePayload(_deployment->get("payload"))) {
    }

    std::shared_ptr<const DeploymentContext> DeploymentContext::fromEvent(
        const data::Value &event) {
        if(!event.isMap()) {
            return {};
        }
        auto deployment = event.getMap()->get("deployment");
        if(!deployment.isMap()) {
            return {};
        }
        return std::make_shared<const DeploymentContext>(deployment.getMap());
    }

    std::shared_ptr<const DeploymentContext> DeploymentContext::fromEventFile(
        const std::filesystem::path &path) {
        try {
            return fromEvent(conv::JsonHelper::parseFile(path));
        } catch(const errors::JsonParseError &err) {
            LOG.atWarn("event-read").kv("path", path.string()).cause(err).log();
            return {};
        }
    }

    data::Value DeploymentContext::field(std::string_view name) const {
        return _deployment->get(name);
    }

    data::Value DeploymentContext::payloadField(std::string_view name) const {
        return _payload->get(name);
    }

    std::string DeploymentContext::idString() const {
        auto value = id();
        if(value.isString()) {
            return value.getString();
        }
        if(value.isNumber()) {
            return std::to_string(value.getInt());
        }
        return {};
    }
} // namespace deployment
