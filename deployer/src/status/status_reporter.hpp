#pragma once
#include "deployment/deployment_context.hpp"
#include "github_context.hpp"
#include "http_client.hpp"
#include <lookup_table.hpp>
#include <memory>
#include <string>

namespace status {

    enum class DeploymentState { Pending, Success, Failure };

    inline constexpr util::LookupTable<DeploymentState, std::string_view, 3> STATE_NAMES{
        DeploymentState::Pending,
        "pending",
        DeploymentState::Success,
        "success",
        DeploymentState::Failure,
        "failure",
    };

    [[nodiscard]] inline std::string_view stateName(DeploymentState state) noexcept {
        return STATE_NAMES.lookupOr(state, "failure");
    }

    /**
     * Receives the deployment state at start, success and failure of a run.
     */
    class StatusReporter {
    public:
        StatusReporter() = default;
        StatusReporter(const StatusReporter &) = delete;
        StatusReporter(StatusReporter &&) = delete;
        StatusReporter &operator=(const StatusReporter &) = delete;
        StatusReporter &operator=(StatusReporter &&) = delete;
        virtual ~StatusReporter() = default;

        virtual void notify(DeploymentState state) = 0;
    };

    class NoopStatusReporter : public StatusReporter {
    public:
        void notify(DeploymentState) override {
        }
    };

    /**
     * Decorator that never lets a reporting failure escape.
     */
    class NonFatalStatusReporter : public StatusReporter {
        std::shared_ptr<StatusReporter> _inner;

    public:
        explicit NonFatalStatusReporter(std::shared_ptr<StatusReporter> inner)
            : _inner(std::move(inner)) {
        }

        void notify(DeploymentState state) noexcept override;
    };

    /**
     * Creates deployment statuses through the GitHub REST API.
     */
    class GitHubStatusReporter : public StatusReporter {
        std::string _token;
        std::string _deploymentId;
        GitHubContext _github;
        std::shared_ptr<HttpClient> _client;

    public:
        static constexpr auto ACCEPT = "application/vnd.github.ant-man-preview+json";
        static constexpr auto USER_AGENT = "helm-deployer";
        static constexpr auto CONTENT_TYPE = "application/json";

        GitHubStatusReporter(
            std::string token,
            std::string deploymentId,
            GitHubContext github,
            std::shared_ptr<HttpClient> client)
            : _token(std::move(token)), _deploymentId(std::move(deploymentId)),
              _github(std::move(github)), _client(std::move(client)) {
        }

        [[nodiscard]] std::string statusUrl() const;
        [[nodiscard]] std::string checksUrl() const;
        [[nodiscard]] std::string requestBody(DeploymentState state) const;
        [[nodiscard]] HttpHeaders requestHeaders(const std::string &body) const;

        /**
         * @throws errors::StatusReportError on transport failure or a non-2xx response
         */
        void notify(DeploymentState state) override;
    };

    /**
     * Reporter for a run: a GitHub reporter when there is a token and a deployment, otherwise
     * a no-op.
     */
    std::shared_ptr<StatusReporter> makeStatusReporter(
        const std::string &token,
        const std::shared_ptr<const deployment::DeploymentContext> &context,
        const GitHubContext &github,
        std::shared_ptr<HttpClient> client);
} // namespace status
