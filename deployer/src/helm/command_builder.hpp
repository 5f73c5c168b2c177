#pragma once
#include "config/resolved_config.hpp"
#include "tool_variant.hpp"
#include <string>
#include <vector>

namespace helm {

    using Args = std::vector<std::string>;

    /**
     * Pure argument vector builders. Every flag/value pair is a discrete element; nothing is
     * quoted or escaped.
     */
    class CommandBuilder {
    public:
        [[nodiscard]] static Args deleteCommand(
            ToolVariant variant, std::string_view ns, std::string_view release);

        [[nodiscard]] static Args upgradeCommand(const config::ResolvedConfig &config);

        /**
         * repo add followed by repo update, or nothing if no repository is configured.
         * @throws errors::MissingRepoAliasError if a repository is given without an alias
         */
        [[nodiscard]] static std::vector<Args> repoCommands(const config::ResolvedConfig &config);

        [[nodiscard]] static Args pluginInstallCommand(const config::PluginSpec &plugin);
    };
} // namespace helm
