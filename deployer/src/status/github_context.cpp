#include "github_context.hpp"
#include <string_util.hpp>

namespace status {

    GitHubContext GitHubContext::fromEnvironment(const lifecycle::SysProperties &env) {
        GitHubContext context;
        auto repository = env.getOr(GITHUB_REPOSITORY, "");
        auto slash = repository.find('/');
        if(slash != std::string::npos) {
            context.owner = repository.substr(0, slash);
            context.repo = repository.substr(slash + 1);
        }
        context.sha = env.getOr(GITHUB_SHA, "");
        context.apiUrl = util::trimTrailing(env.getOr(GITHUB_API_URL, DEFAULT_API_URL), '/');
        context.serverUrl =
            util::trimTrailing(env.getOr(GITHUB_SERVER_URL, DEFAULT_SERVER_URL), '/');
        context.eventPath = env.getOr(GITHUB_EVENT_PATH, "");
        return context;
    }
} // namespace status
