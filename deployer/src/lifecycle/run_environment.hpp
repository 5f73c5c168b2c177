#pragma once
#include "sys_properties.hpp"
#include <filesystem>
#include <memory>

namespace lifecycle {

    /**
     * Prepares the environment every tool invocation of a run sees: XDG directories point at
     * the helm home, and an inline kubeconfig is materialized to the work directory.
     */
    class RunEnvironment {
        std::shared_ptr<SysProperties> _env;
        std::filesystem::path _helmHome;
        std::filesystem::path _workDir;

    public:
        static constexpr auto DEFAULT_HELM_HOME = "/root/.helm/";
        static constexpr auto KUBECONFIG_NAME = "kubeconfig.yml";

        RunEnvironment(
            std::shared_ptr<SysProperties> env,
            std::filesystem::path helmHome,
            std::filesystem::path workDir)
            : _env(std::move(env)), _helmHome(std::move(helmHome)), _workDir(std::move(workDir)) {
        }

        /**
         * @throws std::ios_base::failure or std::filesystem::filesystem_error if the
         * kubeconfig cannot be written
         */
        void prepare();

        [[nodiscard]] std::filesystem::path kubeconfigPath() const {
            return _workDir / KUBECONFIG_NAME;
        }

        /**
         * Plugin cache of the helm home, where plugin installs leave their clones.
         */
        [[nodiscard]] std::filesystem::path pluginDirectory() const {
            return _helmHome / "helm" / "plugins";
        }

        [[nodiscard]] std::shared_ptr<const SysProperties> environment() const {
            return _env;
        }
    };
} // namespace lifecycle
