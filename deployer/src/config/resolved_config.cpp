#include "resolved_config.hpp"
#include "conv/json_conv.hpp"
#include "helm/naming.hpp"
#include "logging/log_manager.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.config.ResolvedConfig");

namespace config {

    static constexpr ResolveOptions REQUIRED{.required = true};
    static constexpr std::string_view MASK{"***"};

    static std::optional<std::string> optionalString(
        const InputResolver &resolver, std::string_view name) {
        auto value = resolver.resolveString(name);
        if(value.empty()) {
            return {};
        }
        return value;
    }

    ResolvedConfig ResolvedConfig::resolve(const InputResolver &resolver) {
        ResolvedConfig config;
        auto track = resolver.resolveString("track");
        if(!track.empty()) {
            config.track = track;
        }
        config.appName = resolver.resolveString("release", REQUIRED);
        config.release = helm::releaseName(config.appName, config.track);
        config.ns = resolver.resolveString("namespace", REQUIRED);
        config.chart = helm::chartRef(resolver.resolveString("chart", REQUIRED));
        config.chartVersion = optionalString(resolver, "chart_version");
        config.values = decodeValues(resolver.resolve("values").value_or(data::Value{}));
        config.task = optionalString(resolver, "task");
        config.version = optionalString(resolver, "version");
        config.valueFiles =
            decodeValueFiles(resolver.resolve("value_files").value_or(data::Value{}));
        config.removeCanary = parseFlag(resolver.resolve("remove_canary"));
        config.timeout = optionalString(resolver, "timeout");
        config.dryRun = parseFlag(resolver.resolveExplicit("dry-run"));
        config.atomic = parseFlag(resolver.resolve("atomic"), true);
        auto helmBinary = resolver.resolveString("helm");
        if(!helmBinary.empty()) {
            config.helm = helmBinary;
        }
        config.variant = helm::toolVariant(config.helm);
        config.repo = optionalString(resolver, "repo");
        config.repoAlias = optionalString(resolver, "repo-alias");
        config.repoUsername = optionalString(resolver, "repo-username");
        config.repoPassword = optionalString(resolver, "repo-password");
        config.plugins = decodePlugins(resolver.resolve("plugins").value_or(data::Value{}));
        return config;
    }

    static std::string valuesText(const ValueSet &values) {
        auto map = std::make_shared<data::Map>();
        for(const auto &[key, value] : values.entries) {
            map->put(key, value);
        }
        std::string text = conv::JsonHelper::toJson(data::Value{map});
        if(values.expression.has_value()) {
            text += " " + values.expression.value();
        }
        return text;
    }

    static data::Value optionalText(const std::optional<std::string> &value) {
        return value.has_value() ? data::Value{value.value()} : data::Value{};
    }

    void ResolvedConfig::logParameters() const {
        if(!LOG.isDebugEnabled()) {
            return;
        }
        auto valueFileList = std::make_shared<data::List>();
        for(const auto &file : valueFiles) {
            valueFileList->push(file);
        }
        auto pluginList = std::make_shared<data::List>();
        for(const auto &plugin : plugins) {
            pluginList->push(data::Map::of(
                {{"url", plugin.url}, {"version", optionalText(plugin.version)}}));
        }
        LOG.atDebug("param")
            .kv("helm", helm)
            .kv("track", track)
            .kv("release", release)
            .kv("appName", appName)
            .kv("namespace", ns)
            .kv("chart", chart)
            .kv("chart_version", optionalText(chartVersion))
            .kv("values", [this]() -> data::Value { return valuesText(values); })
            .kv("dryRun", dryRun)
            .kv("task", optionalText(task))
            .kv("version", optionalText(version))
            .kv("valueFiles", data::Value{valueFileList})
            .kv("removeCanary", removeCanary)
            .kv("timeout", optionalText(timeout))
            .kv("atomic", atomic)
            .kv("repo", optionalText(repo))
            .kv("repoAlias", optionalText(repoAlias))
            .kv("repoUsername", optionalText(repoUsername))
            .kv("repoPassword", repoPassword.has_value() ? data::Value{MASK} : data::Value{})
            .kv("plugins", data::Value{pluginList})
            .log("resolved parameters");
    }
} // namespace config
