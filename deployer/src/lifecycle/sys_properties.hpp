#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lifecycle {
    using namespace std::string_view_literals;

    /**
     * Snapshot of the process environment. Child processes receive this snapshot rather than
     * the live environment, so changes made here are what every tool invocation sees.
     */
    class SysProperties {
    private:
        mutable std::shared_mutex _mutex;
        std::map<std::string, std::string, std::less<>> _cache;

    public:
        static constexpr auto XDG_DATA_HOME = "XDG_DATA_HOME"sv;
        static constexpr auto XDG_CACHE_HOME = "XDG_CACHE_HOME"sv;
        static constexpr auto XDG_CONFIG_HOME = "XDG_CONFIG_HOME"sv;
        static constexpr auto KUBECONFIG = "KUBECONFIG"sv;
        static constexpr auto KUBECONFIG_FILE = "KUBECONFIG_FILE"sv;
        static constexpr auto RUNNER_DEBUG = "RUNNER_DEBUG"sv;

        SysProperties() = default;

        void parseEnv(std::span<char *const> envs);

        /**
         * Parse a null terminated environment block such as environ.
         */
        void parseEnv(char *const *envp);

        [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

        [[nodiscard]] std::string getOr(std::string_view name, std::string_view dflt) const;

        void put(std::string_view name, std::string_view value);

        [[nodiscard]] bool exists(std::string_view name) const;

        void remove(std::string_view name);

        /**
         * Environment in NAME=VALUE form, sorted by name.
         */
        [[nodiscard]] std::vector<std::string> toEnvironment() const;
    };
} // namespace lifecycle
