#include "command_line.hpp"
#include "run_environment.hpp"
#include "status/github_context.hpp"

#include <algorithm>
#include <tuple>

namespace fs = std::filesystem;

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.lifecycle.CommandLine");

namespace lifecycle {

    static inline constexpr std::tuple argumentList{
        makeArgumentFlag(
            [](CommandLine &cli) { cli.requestHelp(); },
            "h",
            "help",
            "Print this usage information"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setInputsPath(fs::path(arg)); },
            "i",
            "inputs",
            "file",
            "YAML file of input values"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.addParam(arg); },
            "p",
            "param",
            "name=value",
            "Input value, overrides the inputs file (repeatable)"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setEventPath(fs::path(arg)); },
            "e",
            "event",
            "file",
            "Deployment webhook event JSON (default $GITHUB_EVENT_PATH)"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setHelmHome(fs::path(arg)); },
            "",
            "helm-home",
            "dir",
            "Helm home the XDG directories point to"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setWorkDir(fs::path(arg)); },
            "w",
            "work-dir",
            "dir",
            "Directory for generated files (default current directory)"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setLogLevel(arg); },
            "",
            "log-level",
            "trace|debug|info|warn|error",
            "Logging level"),
        makeArgumentValue<std::string_view>(
            [](CommandLine &cli, std::string_view arg) { cli.setLogFormat(arg); },
            "",
            "log-format",
            "text|json",
            "Logging format")};

    CommandLine::CommandLine() : _helmHome(RunEnvironment::DEFAULT_HELM_HOME) {
    }

    void CommandLine::parseRawProgramNameAndArgs(std::span<char *const> args) {
        if(args.empty()) {
            throw errors::CommandLineArgumentError("No program name given");
        }
        if(std::find(args.begin(), args.end(), nullptr) != args.end()) {
            throw errors::CommandLineArgumentError("Null pointer in arguments");
        }
        parseArgs({std::next(args.begin()), args.end()});
    }

    void CommandLine::parseArgs(const std::vector<std::string> &args) {
        for(auto i = args.begin(); i != args.end(); i++) {
            if(!std::apply(
                   [](auto &&...args) { return Argument::processArg(args...); },
                   std::tuple_cat(
                       std::tuple<CommandLine &, ArgumentIterator>{
                           *this, ArgumentIterator{args, i}},
                       argumentList))) {
                LOG.atError()
                    .event("parse-args-error")
                    .logAndThrow(errors::CommandLineArgumentError{
                        std::string("Unrecognized option: ") + *i});
            }
        }
    }

    void CommandLine::parseEnv(const SysProperties &env) {
        if(!_eventPath.has_value()) {
            auto eventPath = env.getOr(status::GitHubContext::GITHUB_EVENT_PATH, "");
            if(!eventPath.empty()) {
                _eventPath = fs::path(eventPath);
            }
        }
        if(!_logLevel.has_value() && env.getOr(SysProperties::RUNNER_DEBUG, "") == "1") {
            _logLevel = logging::Level::Debug;
        }
    }

    void CommandLine::printHelp(std::ostream &out) {
        out << "Usage: helm-deployer [options]\n";
        std::apply([&out](auto &&...args) { Argument::printHelp(out, args...); }, argumentList);
    }

    void CommandLine::addParam(std::string_view nameValue) {
        auto eq = nameValue.find('=');
        if(eq == std::string_view::npos || eq == 0) {
            throw errors::CommandLineArgumentError(
                "Expected name=value for --param, got: " + std::string(nameValue));
        }
        _params->put(nameValue.substr(0, eq), std::string(nameValue.substr(eq + 1)));
    }

    void CommandLine::setLogLevel(std::string_view level) {
        auto parsed = logging::LogManager::parseLevel(level);
        if(!parsed.has_value()) {
            throw errors::CommandLineArgumentError("Unknown log level: " + std::string(level));
        }
        _logLevel = parsed;
    }

    void CommandLine::setLogFormat(std::string_view format) {
        auto parsed = logging::LogManager::parseFormat(format);
        if(!parsed.has_value()) {
            throw errors::CommandLineArgumentError("Unknown log format: " + std::string(format));
        }
        _logFormat = parsed;
    }

} // namespace lifecycle
