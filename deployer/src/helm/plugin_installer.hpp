#pragma once
#include "config/value_decoder.hpp"
#include "platform_abstraction/abstract_process_runner.hpp"
#include <filesystem>
#include <vector>

namespace helm {

    /**
     * Installs plugins in order, then removes the clone directory each install may leave in
     * the plugin cache.
     */
    class PluginInstaller {
        ipc::ProcessRunner &_runner;
        std::string _helm;
        std::filesystem::path _pluginDir;

        void removeResidual(const config::PluginSpec &plugin);

    public:
        PluginInstaller(
            ipc::ProcessRunner &runner, std::string helm, std::filesystem::path pluginDir)
            : _runner(runner), _helm(std::move(helm)), _pluginDir(std::move(pluginDir)) {
        }

        [[nodiscard]] std::filesystem::path residualDirectory(
            const config::PluginSpec &plugin) const;

        /**
         * @throws errors::PluginInstallError on the first failing install
         */
        void install(const std::vector<config::PluginSpec> &plugins);
    };
} // namespace helm
