#pragma once
#include "data/value.hpp"
#include "deployment/deployment_context.hpp"
#include "lifecycle/sys_properties.hpp"
#include <memory>

namespace config {

    /**
     * One layer of input resolution.
     */
    class InputSource {
    public:
        InputSource() = default;
        InputSource(const InputSource &) = delete;
        InputSource(InputSource &&) = delete;
        InputSource &operator=(const InputSource &) = delete;
        InputSource &operator=(InputSource &&) = delete;
        virtual ~InputSource() = default;

        [[nodiscard]] virtual std::string_view sourceName() const noexcept = 0;

        /**
         * Value for the named input, null if this layer does not know it.
         */
        [[nodiscard]] virtual data::Value lookup(std::string_view name) const = 0;
    };

    /**
     * Explicit parameters. Highest first: --param on the command line, INPUT_<NAME>
     * environment variables, then the inputs file. Underscores in the requested name are
     * looked up as hyphens.
     */
    class ParameterSource : public InputSource {
        std::shared_ptr<data::Map> _params;
        std::shared_ptr<data::Map> _fileInputs;
        std::shared_ptr<const lifecycle::SysProperties> _env;

    public:
        ParameterSource(
            std::shared_ptr<data::Map> params,
            std::shared_ptr<data::Map> fileInputs,
            std::shared_ptr<const lifecycle::SysProperties> env);

        static std::string parameterName(std::string_view name);
        static std::string environmentName(std::string_view parameterName);

        [[nodiscard]] std::string_view sourceName() const noexcept override {
            return "parameter";
        }

        [[nodiscard]] data::Value lookup(std::string_view name) const override;
    };

    /**
     * Top level fields of the deployment object.
     */
    class DeploymentSource : public InputSource {
        std::shared_ptr<const deployment::DeploymentContext> _context;

    public:
        explicit DeploymentSource(std::shared_ptr<const deployment::DeploymentContext> context)
            : _context(std::move(context)) {
        }

        [[nodiscard]] std::string_view sourceName() const noexcept override {
            return "deployment";
        }

        [[nodiscard]] data::Value lookup(std::string_view name) const override {
            return _context ? _context->field(name) : data::Value{};
        }
    };

    /**
     * Fields of the deployment payload.
     */
    class PayloadSource : public InputSource {
        std::shared_ptr<const deployment::DeploymentContext> _context;

    public:
        explicit PayloadSource(std::shared_ptr<const deployment::DeploymentContext> context)
            : _context(std::move(context)) {
        }

        [[nodiscard]] std::string_view sourceName() const noexcept override {
            return "payload";
        }

        [[nodiscard]] data::Value lookup(std::string_view name) const override {
            return _context ? _context->payloadField(name) : data::Value{};
        }
    };
} // namespace config
