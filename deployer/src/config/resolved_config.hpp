#pragma once
#include "helm/tool_variant.hpp"
#include "input_resolver.hpp"
#include "value_decoder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace config {

    /**
     * Everything one run needs, resolved once up front.
     */
    struct ResolvedConfig {
        std::string track{"stable"};
        std::string appName;
        std::string release;
        std::string ns;
        std::string chart;
        std::optional<std::string> chartVersion;
        ValueSet values;
        std::vector<std::string> valueFiles;
        std::vector<PluginSpec> plugins;
        std::optional<std::string> task;
        std::optional<std::string> version;
        bool removeCanary{false};
        std::optional<std::string> timeout;
        bool dryRun{false};
        bool atomic{true};
        std::string helm{helm::DEFAULT_HELM};
        helm::ToolVariant variant{helm::ToolVariant::Helm3};
        std::optional<std::string> repo;
        std::optional<std::string> repoAlias;
        std::optional<std::string> repoUsername;
        std::optional<std::string> repoPassword;

        /**
         * @throws errors::MissingRequiredInputError for release, namespace or chart
         */
        static ResolvedConfig resolve(const InputResolver &resolver);

        [[nodiscard]] bool isRemove() const noexcept {
            return task.has_value() && task.value() == "remove";
        }

        /**
         * Log every parameter at debug level, secrets masked.
         */
        void logParameters() const;
    };
} // namespace config
