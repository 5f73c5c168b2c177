#include "plugin_installer.hpp"
#include "command_builder.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "naming.hpp"
#include "util/non_fatal.hpp"
#include <tuple>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.helm.PluginInstaller");

namespace helm {

    std::filesystem::path PluginInstaller::residualDirectory(
        const config::PluginSpec &plugin) const {
        return _pluginDir / residualSlug(plugin.url);
    }

    void PluginInstaller::install(const std::vector<config::PluginSpec> &plugins) {
        for(const auto &plugin : plugins) {
            if(plugin.url.empty()) {
                LOG.atError("plugin-install").log("plugin.url could not be found");
                continue;
            }
            LOG.atDebug("plugin-install")
                .kv("url", plugin.url)
                .kv("version", plugin.version.value_or(""))
                .log();
            try {
                std::ignore = _runner.execute(_helm, CommandBuilder::pluginInstallCommand(plugin));
            } catch(const errors::ToolInvocationError &err) {
                LOG.atError("plugin-install")
                    .kv("url", plugin.url)
                    .logAndThrow(errors::PluginInstallError(err.what()));
            }
            removeResidual(plugin);
        }
    }

    void PluginInstaller::removeResidual(const config::PluginSpec &plugin) {
        // helm may leave excess folders in the plugin directory
        util::nonFatal(LOG, "plugin-cleanup", [this, &plugin]() {
            auto cloneDir = residualDirectory(plugin);
            std::error_code ec;
            bool exists = std::filesystem::exists(cloneDir, ec);
            LOG.atDebug("plugin-cleanup")
                .kv("path", cloneDir.string())
                .kv("exists", exists)
                .log();

            std::string output;
            ipc::ExecOptions options{
                .ignoreReturnCode = true,
                .outputListener = [&output](std::string_view text) { output.append(text); },
            };
            int exitCode = _runner.execute("rm", {"-rf", cloneDir.string()}, options);
            LOG.atDebug("plugin-cleanup")
                .kv("exitCode", exitCode)
                .kv("output", output)
                .log();
        });
    }
} // namespace helm
