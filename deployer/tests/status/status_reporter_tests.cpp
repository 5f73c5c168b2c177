#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "status/status_reporter.hpp"
#include <catch2/catch_all.hpp>

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN
class RecordingHttpClient : public status::HttpClient {
public:
    int statusCode{201};
    bool failTransport{false};
    std::vector<std::string> urls;
    std::vector<status::HttpHeaders> headers;
    std::vector<std::string> bodies;

    status::HttpResponse post(
        const std::string &url,
        const status::HttpHeaders &requestHeaders,
        const std::string &body) override {
        if(failTransport) {
            throw errors::StatusReportError("Failed to establish connection");
        }
        urls.push_back(url);
        headers.push_back(requestHeaders);
        bodies.push_back(body);
        return {statusCode, "{}"};
    }
};

static std::string headerValue(const status::HttpHeaders &headers, std::string_view name) {
    for(const auto &[key, value] : headers) {
        if(key == name) {
            return value;
        }
    }
    return {};
}

static status::GitHubContext githubContext() {
    lifecycle::SysProperties env;
    env.put("GITHUB_REPOSITORY", "octo/hello");
    env.put("GITHUB_SHA", "abc123");
    return status::GitHubContext::fromEnvironment(env);
}

SCENARIO("GitHub run context", "[status]") {
    GIVEN("A runner environment") {
        auto github = githubContext();
        THEN("Repository coordinates are split and defaults apply") {
            REQUIRE(github.owner == "octo");
            REQUIRE(github.repo == "hello");
            REQUIRE(github.sha == "abc123");
            REQUIRE(github.apiUrl == "https://api.github.com");
            REQUIRE(github.serverUrl == "https://github.com");
        }
    }
    GIVEN("An enterprise server environment") {
        lifecycle::SysProperties env;
        env.put("GITHUB_API_URL", "https://ghe.example/api/v3/");
        env.put("GITHUB_SERVER_URL", "https://ghe.example");
        auto github = status::GitHubContext::fromEnvironment(env);
        THEN("The configured URLs are used without trailing slash") {
            REQUIRE(github.apiUrl == "https://ghe.example/api/v3");
            REQUIRE(github.serverUrl == "https://ghe.example");
            REQUIRE_FALSE(github.hasRepository());
        }
    }
}

SCENARIO("Posting deployment statuses", "[status]") {
    auto client = std::make_shared<RecordingHttpClient>();
    status::GitHubStatusReporter reporter("t0ken", "42", githubContext(), client);

    GIVEN("A successful API") {
        WHEN("The pending state is reported") {
            reporter.notify(status::DeploymentState::Pending);
            THEN("The deployment status endpoint is called") {
                REQUIRE(client->urls.size() == 1);
                REQUIRE(
                    client->urls[0]
                    == "https://api.github.com/repos/octo/hello/deployments/42/statuses");
            }
            THEN("The body carries state and the checks URL") {
                auto body = conv::JsonHelper::parse(client->bodies[0]).getMap();
                REQUIRE(body->get("state").getString() == "pending");
                auto url = "https://github.com/octo/hello/commit/abc123/checks";
                REQUIRE(body->get("log_url").getString() == url);
                REQUIRE(body->get("target_url").getString() == url);
            }
            THEN("The request is authorized with the preview media type") {
                const auto &headers = client->headers[0];
                REQUIRE(headerValue(headers, "Authorization") == "token t0ken");
                REQUIRE(
                    headerValue(headers, "Accept")
                    == "application/vnd.github.ant-man-preview+json");
                REQUIRE(headerValue(headers, "Content-Type") == "application/json");
                REQUIRE(
                    headerValue(headers, "Content-Length")
                    == std::to_string(client->bodies[0].size()));
                REQUIRE_FALSE(headerValue(headers, "User-Agent").empty());
            }
        }
    }

    GIVEN("An API rejecting the request") {
        client->statusCode = 404;
        THEN("The reporter raises a status error") {
            REQUIRE_THROWS_MATCHES(
                reporter.notify(status::DeploymentState::Success),
                errors::StatusReportError,
                Catch::Matchers::MessageMatches(ContainsSubstring("404")));
        }
        THEN("The non-fatal decorator swallows it") {
            auto inner = std::make_shared<status::GitHubStatusReporter>(
                "t0ken", "42", githubContext(), client);
            status::NonFatalStatusReporter nonFatal(inner);
            REQUIRE_NOTHROW(nonFatal.notify(status::DeploymentState::Failure));
            REQUIRE(client->bodies.size() == 1);
        }
    }

    GIVEN("A transport failure") {
        client->failTransport = true;
        status::NonFatalStatusReporter nonFatal(std::make_shared<status::GitHubStatusReporter>(
            "t0ken", "42", githubContext(), client));
        THEN("The decorator never throws") {
            REQUIRE_NOTHROW(nonFatal.notify(status::DeploymentState::Pending));
        }
    }
}

SCENARIO("Choosing a status reporter", "[status]") {
    auto client = std::make_shared<RecordingHttpClient>();
    auto context = std::make_shared<const deployment::DeploymentContext>(
        data::Map::of({{"id", 5}}));

    GIVEN("No token") {
        auto reporter = status::makeStatusReporter("", context, githubContext(), client);
        THEN("Statuses are not sent") {
            REQUIRE(std::dynamic_pointer_cast<status::NoopStatusReporter>(reporter));
            reporter->notify(status::DeploymentState::Pending);
            REQUIRE(client->urls.empty());
        }
    }
    GIVEN("No deployment") {
        auto reporter = status::makeStatusReporter("t0ken", nullptr, githubContext(), client);
        THEN("Statuses are not sent") {
            REQUIRE(std::dynamic_pointer_cast<status::NoopStatusReporter>(reporter));
        }
    }
    GIVEN("A token and a deployment") {
        auto reporter = status::makeStatusReporter("t0ken", context, githubContext(), client);
        THEN("Statuses go to the deployment") {
            reporter->notify(status::DeploymentState::Success);
            REQUIRE(
                client->urls.at(0)
                == "https://api.github.com/repos/octo/hello/deployments/5/statuses");
        }
    }
}
// NOLINTEND
