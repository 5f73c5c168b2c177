#pragma once
#include "lifecycle/sys_properties.hpp"
#include "platform_abstraction/abstract_process_runner.hpp"
#include <iostream>
#include <memory>

namespace ipc {

    /**
     * Blocking runner. The child gets the environment snapshot, its output is echoed to the
     * given streams.
     */
    class LinuxProcessRunner : public ProcessRunner {
        std::shared_ptr<const lifecycle::SysProperties> _env;
        std::ostream &_echoOut;
        std::ostream &_echoErr;

    public:
        explicit LinuxProcessRunner(
            std::shared_ptr<const lifecycle::SysProperties> env,
            std::ostream &echoOut = std::cout,
            std::ostream &echoErr = std::cerr)
            : _env(std::move(env)), _echoOut(echoOut), _echoErr(echoErr) {
        }

        using ProcessRunner::execute;

        int execute(
            const std::string &binary,
            const std::vector<std::string> &args,
            const ExecOptions &options) override;
    };
} // namespace ipc
