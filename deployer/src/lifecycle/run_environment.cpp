#include "run_environment.hpp"
#include "logging/log_manager.hpp"
#include "util/commitable_file.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.lifecycle.RunEnvironment");

namespace lifecycle {

    void RunEnvironment::prepare() {
        auto home = _helmHome.string();
        _env->put(SysProperties::XDG_DATA_HOME, home);
        _env->put(SysProperties::XDG_CACHE_HOME, home);
        _env->put(SysProperties::XDG_CONFIG_HOME, home);

        // An unset secret arrives as an empty variable; keep any existing KUBECONFIG then
        auto inlineConfig = _env->getOr(SysProperties::KUBECONFIG_FILE, "");
        if(!inlineConfig.empty()) {
            auto path = kubeconfigPath();
            util::CommitableFile file(path);
            file.write(inlineConfig).commit();
            _env->put(SysProperties::KUBECONFIG, path.string());
        }
        LOG.atDebug("environment")
            .kv("helmHome", home)
            .kv("KUBECONFIG", _env->getOr(SysProperties::KUBECONFIG, ""))
            .log();
    }
} // namespace lifecycle
