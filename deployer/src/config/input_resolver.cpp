#include "input_resolver.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "value_decoder.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.config.InputResolver");

namespace config {

    InputResolver::InputResolver(std::vector<std::shared_ptr<InputSource>> sources)
        : _sources(std::move(sources)) {
        if(_sources.empty()) {
            throw std::invalid_argument("InputResolver requires at least one source");
        }
    }

    InputResolver InputResolver::standard(
        std::shared_ptr<InputSource> parameters,
        const std::shared_ptr<const deployment::DeploymentContext> &context) {
        return InputResolver{{
            std::make_shared<PayloadSource>(context),
            std::make_shared<DeploymentSource>(context),
            std::move(parameters),
        }};
    }

    static std::optional<data::Value> checkRequired(
        std::string_view name, std::optional<data::Value> value, const ResolveOptions &options) {
        if(options.required && (!value.has_value() || !value->truthy())) {
            LOG.atError("input-missing")
                .kv("name", name)
                .logAndThrow(errors::MissingRequiredInputError(std::string(name)));
        }
        return value;
    }

    std::optional<data::Value> InputResolver::resolve(
        std::string_view name, const ResolveOptions &options) const {
        for(const auto &source : _sources) {
            auto value = source->lookup(name);
            if(value.truthy()) {
                LOG.atTrace("input-source")
                    .kv("name", name)
                    .kv("source", source->sourceName())
                    .log();
                return value;
            }
        }
        return resolveExplicit(name, options);
    }

    std::optional<data::Value> InputResolver::resolveExplicit(
        std::string_view name, const ResolveOptions &options) const {
        auto value = _sources.back()->lookup(name);
        if(value.isNull()) {
            return checkRequired(name, {}, options);
        }
        return checkRequired(name, value, options);
    }

    std::string InputResolver::resolveString(
        std::string_view name, const ResolveOptions &options) const {
        auto value = resolve(name, options);
        if(!value.has_value()) {
            return {};
        }
        return renderValue(value.value());
    }
} // namespace config
