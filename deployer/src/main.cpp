#include "config/input_resolver.hpp"
#include "config/value_decoder.hpp"
#include "conv/yaml_conv.hpp"
#include "deployment/task/default_deployment_task.hpp"
#include "errors/errors.hpp"
#include "lifecycle/command_line.hpp"
#include "lifecycle/run_environment.hpp"
#include "logging/log_manager.hpp"
#include "platform_abstraction/linux/process_runner.hpp"
#include "status/github_context.hpp"
#include "status/http_client.hpp"
#include "status/status_reporter.hpp"

#include <aws/crt/Api.h>
#include <cstdlib>
#include <iostream>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.main");

namespace {
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    std::shared_ptr<data::Map> readInputsFile(const lifecycle::CommandLine &commandLine) {
        if(!commandLine.getInputsPath().has_value()) {
            return std::make_shared<data::Map>();
        }
        const auto &path = commandLine.getInputsPath().value();
        auto inputs = conv::YamlReader::read(path);
        if(inputs.isNull()) {
            return std::make_shared<data::Map>();
        }
        if(!inputs.isMap()) {
            LOG.atError("inputs-file")
                .kv("path", path.string())
                .logAndThrow(errors::ConfigFileError(
                    "Inputs file must contain a mapping: " + path.string()));
        }
        return inputs.getMap();
    }

    void configureLogging(const lifecycle::CommandLine &commandLine) {
        auto manager = logging::LogManager::instance();
        if(commandLine.getLogLevel().has_value()) {
            manager->setLevel(commandLine.getLogLevel().value());
        }
        if(commandLine.getLogFormat().has_value()) {
            manager->setFormat(commandLine.getLogFormat().value());
        }
    }
} // namespace

int main(int argc, char *argv[], char *envp[]) { // NOLINT(*-c-arrays)
    Aws::Crt::ApiHandle apiHandle(Aws::Crt::DefaultAllocator());
    auto env = std::make_shared<lifecycle::SysProperties>();
    env->parseEnv(envp);

    lifecycle::CommandLine commandLine;
    std::shared_ptr<data::Map> fileInputs;
    try {
        commandLine.parseRawProgramNameAndArgs({argv, static_cast<size_t>(argc)});
        commandLine.parseEnv(*env);
        if(commandLine.isHelpRequested()) {
            lifecycle::CommandLine::printHelp(std::cout);
            return EXIT_SUCCESS;
        }
        configureLogging(commandLine);
        fileInputs = readInputsFile(commandLine);
    } catch(const errors::CommandLineArgumentError &err) {
        std::cerr << err.what() << '\n';
        lifecycle::CommandLine::printHelp(std::cerr);
        return EXIT_USAGE;
    } catch(const errors::ConfigFileError &err) {
        std::cerr << err.what() << '\n';
        return EXIT_USAGE;
    }

    std::shared_ptr<const deployment::DeploymentContext> context;
    if(commandLine.getEventPath().has_value()) {
        context = deployment::DeploymentContext::fromEventFile(commandLine.getEventPath().value());
    }

    auto parameters =
        std::make_shared<config::ParameterSource>(commandLine.getParams(), fileInputs, env);
    auto resolver = std::make_shared<const config::InputResolver>(
        config::InputResolver::standard(parameters, context));

    auto token = config::renderValue(resolver->resolveExplicit("token").value_or(data::Value{}));
    auto reporter = status::makeStatusReporter(
        token,
        context,
        status::GitHubContext::fromEnvironment(*env),
        std::make_shared<status::CrtHttpClient>());

    auto workDir = commandLine.getWorkDir().empty() ? std::filesystem::current_path()
                                                    : commandLine.getWorkDir();
    lifecycle::RunEnvironment runEnvironment(env, commandLine.getHelmHome(), workDir);
    ipc::LinuxProcessRunner runner(env);
    deployment::TaskServices services{runner, runEnvironment};
    DefaultDeploymentTask task(services, reporter);

    deployment::Deployment deployment{.resolver = resolver};
    auto result = task.handleTaskExecution(deployment);
    if(result.deploymentStatus != deployment::DeploymentStatus::SUCCESSFUL) {
        std::cout << "::error::" << result.message << std::endl;
        return EXIT_FAILED;
    }
    return EXIT_SUCCESS;
}
