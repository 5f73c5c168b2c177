#include "process_runner.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include "platform_abstraction/startable.hpp"
#include <string_util.hpp>
#include <system_error>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.ipc.ProcessRunner");

namespace ipc {

    static std::string failureMessage(const std::string &binary, int exitCode) {
        return "The process '" + binary + "' failed with exit code " + std::to_string(exitCode);
    }

    // Printable command line with credentials masked
    static std::string commandLine(
        const std::string &binary, const std::vector<std::string> &args) {
        std::vector<std::string> parts{binary};
        for(const auto &arg : args) {
            parts.emplace_back(
                util::startsWith(arg, "--password=") ? std::string{"--password=***"} : arg);
        }
        return util::join(parts, " ");
    }

    int LinuxProcessRunner::execute(
        const std::string &binary,
        const std::vector<std::string> &args,
        const ExecOptions &options) {

        auto log = LOG.createChild();
        log.addDefaultKeyValue("binary", binary);
        log.atInfo("exec").log("[command]" + commandLine(binary, args));

        std::unique_ptr<Process> process;
        try {
            process = Startable{}
                          .withCommand(binary)
                          .withArguments(args)
                          .withEnvironment(_env->toEnvironment())
                          .withOutput([this, &options](std::string_view text) {
                              _echoOut << text << std::flush;
                              if(options.outputListener) {
                                  options.outputListener(text);
                              }
                          })
                          .withError([this](std::string_view text) {
                              _echoErr << text << std::flush;
                          })
                          .start();
        } catch(const std::system_error &err) {
            log.atError("exec-failed")
                .logAndThrow(errors::ToolInvocationError(
                    "Unable to start '" + binary + "': " + err.what(), -1));
        }

        int exitCode = 0;
        try {
            exitCode = process->wait();
        } catch(const std::system_error &err) {
            log.atError("exec-failed")
                .logAndThrow(errors::ToolInvocationError(
                    "Unable to wait for '" + binary + "': " + err.what(), -1));
        }
        log.atDebug("exec-complete").kv("exitCode", exitCode).log();
        if(exitCode != 0 && !options.ignoreReturnCode) {
            log.atError("exec-failed")
                .kv("exitCode", exitCode)
                .logAndThrow(
                    errors::ToolInvocationError(failureMessage(binary, exitCode), exitCode));
        }
        return exitCode;
    }
} // namespace ipc
