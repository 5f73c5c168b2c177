#pragma once
#include "lifecycle/sys_properties.hpp"
#include <string>

namespace status {
    using namespace std::string_view_literals;

    /**
     * Repository coordinates of the workflow run, taken from the runner environment.
     */
    struct GitHubContext {
        static constexpr auto GITHUB_REPOSITORY = "GITHUB_REPOSITORY"sv;
        static constexpr auto GITHUB_SHA = "GITHUB_SHA"sv;
        static constexpr auto GITHUB_API_URL = "GITHUB_API_URL"sv;
        static constexpr auto GITHUB_SERVER_URL = "GITHUB_SERVER_URL"sv;
        static constexpr auto GITHUB_EVENT_PATH = "GITHUB_EVENT_PATH"sv;
        static constexpr auto DEFAULT_API_URL = "https://api.github.com"sv;
        static constexpr auto DEFAULT_SERVER_URL = "https://github.com"sv;

        std::string owner;
        std::string repo;
        std::string sha;
        std::string apiUrl{DEFAULT_API_URL};
        std::string serverUrl{DEFAULT_SERVER_URL};
        std::string eventPath;

        static GitHubContext fromEnvironment(const lifecycle::SysProperties &env);

        [[nodiscard]] bool hasRepository() const noexcept {
            return !owner.empty() && !repo.empty();
        }
    };
} // namespace status
