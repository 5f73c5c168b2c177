#pragma once
#include "input_source.hpp"
#include <optional>
#include <vector>

namespace config {

    struct ResolveOptions {
        bool required{false};
    };

    /**
     * Resolves named inputs over an ordered list of sources, highest precedence first. The
     * first truthy value wins. The last source is the explicit parameter layer, whose raw
     * value is returned when nothing is truthy.
     */
    class InputResolver {
        std::vector<std::shared_ptr<InputSource>> _sources;

    public:
        explicit InputResolver(std::vector<std::shared_ptr<InputSource>> sources);

        /**
         * Standard layering: payload, deployment, explicit parameters.
         */
        static InputResolver standard(
            std::shared_ptr<InputSource> parameters,
            const std::shared_ptr<const deployment::DeploymentContext> &context);

        /**
         * @throws errors::MissingRequiredInputError if required and nothing non-empty is found
         */
        [[nodiscard]] std::optional<data::Value> resolve(
            std::string_view name, const ResolveOptions &options = {}) const;

        /**
         * Consults only the explicit parameter layer.
         */
        [[nodiscard]] std::optional<data::Value> resolveExplicit(
            std::string_view name, const ResolveOptions &options = {}) const;

        /**
         * Resolve and render as a string, empty if absent.
         */
        [[nodiscard]] std::string resolveString(
            std::string_view name, const ResolveOptions &options = {}) const;
    };
} // namespace config
