#include "status_reporter.hpp"
#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.status.StatusReporter");

namespace status {

    constexpr static int HTTP_OK_MIN = 200;
    constexpr static int HTTP_OK_MAX = 299;

    void NonFatalStatusReporter::notify(DeploymentState state) noexcept {
        try {
            _inner->notify(state);
        } catch(const std::exception &err) {
            LOG.atWarn("status-failed")
                .kv("state", std::string(stateName(state)))
                .log(std::string("Failed to set deployment status: ") + err.what());
        }
    }

    std::string GitHubStatusReporter::statusUrl() const {
        return _github.apiUrl + "/repos/" + _github.owner + "/" + _github.repo + "/deployments/"
               + _deploymentId + "/statuses";
    }

    std::string GitHubStatusReporter::checksUrl() const {
        return _github.serverUrl + "/" + _github.owner + "/" + _github.repo + "/commit/"
               + _github.sha + "/checks";
    }

    std::string GitHubStatusReporter::requestBody(DeploymentState state) const {
        auto url = checksUrl();
        auto body = data::Map::of({
            {"state", std::string(stateName(state))},
            {"log_url", url},
            {"target_url", url},
        });
        return conv::JsonHelper::toJson(body);
    }

    HttpHeaders GitHubStatusReporter::requestHeaders(const std::string &body) const {
        return {
            {"Authorization", "token " + _token},
            {"Accept", ACCEPT},
            {"User-Agent", USER_AGENT},
            {"Content-Type", CONTENT_TYPE},
            {"Content-Length", std::to_string(body.size())},
        };
    }

    void GitHubStatusReporter::notify(DeploymentState state) {
        if(!_github.hasRepository()) {
            LOG.atError("status-post").logAndThrow(errors::StatusReportError(
                "GITHUB_REPOSITORY is not set"));
        }
        auto url = statusUrl();
        auto body = requestBody(state);
        LOG.atDebug("status-post").kv("url", url).kv("state", std::string(stateName(state))).log();
        auto response = _client->post(url, requestHeaders(body), body);
        if(response.statusCode < HTTP_OK_MIN || response.statusCode > HTTP_OK_MAX) {
            LOG.atError("status-post")
                .kv("statusCode", response.statusCode)
                .logAndThrow(errors::StatusReportError(
                    "Deployment status request failed with HTTP "
                    + std::to_string(response.statusCode) + ": " + response.body));
        }
    }

    std::shared_ptr<StatusReporter> makeStatusReporter(
        const std::string &token,
        const std::shared_ptr<const deployment::DeploymentContext> &context,
        const GitHubContext &github,
        std::shared_ptr<HttpClient> client) {

        if(token.empty() || !context) {
            LOG.atDebug("status-disabled").log("not setting deployment status");
            return std::make_shared<NoopStatusReporter>();
        }
        return std::make_shared<GitHubStatusReporter>(
            token, context->idString(), github, std::move(client));
    }
} // namespace status
