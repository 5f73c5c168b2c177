#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ipc {

    struct ExecOptions {
        // return the exit code instead of throwing on a non-zero exit
        bool ignoreReturnCode{false};
        // receives child stdout as it arrives
        std::function<void(std::string_view)> outputListener;
    };

    /**
     * Runs an external tool to completion. No shell is involved; each argument reaches the
     * tool unchanged.
     */
    class ProcessRunner {
    public:
        ProcessRunner() = default;
        ProcessRunner(const ProcessRunner &) = delete;
        ProcessRunner(ProcessRunner &&) = delete;
        ProcessRunner &operator=(const ProcessRunner &) = delete;
        ProcessRunner &operator=(ProcessRunner &&) = delete;
        virtual ~ProcessRunner() = default;

        /**
         * @return exit code of the tool
         * @throws errors::ToolInvocationError if the tool cannot be started, or exits non-zero
         * without ignoreReturnCode
         */
        virtual int execute(
            const std::string &binary,
            const std::vector<std::string> &args,
            const ExecOptions &options) = 0;

        int execute(const std::string &binary, const std::vector<std::string> &args) {
            return execute(binary, args, ExecOptions{});
        }
    };
} // namespace ipc
