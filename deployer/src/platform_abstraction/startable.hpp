#pragma once
#include "abstract_process.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace ipc {

    // class for configuring and running an executable, never through a shell
    class Startable {
        std::string _command;
        std::vector<std::string> _args;
        std::vector<std::string> _envs;
        std::optional<OutputCallback> _outHandler;
        std::optional<OutputCallback> _errHandler;

        // OS-specific start function
        // Starts execution the command with the arguments and environment provided
        std::unique_ptr<Process> start(
            std::string_view command, std::span<char *> argv, std::span<char *> envp) const;

    public:
        std::unique_ptr<Process> start() const {
            if(_command.empty()) {
                throw std::invalid_argument("No command provided");
            }

            auto args = std::vector(1 + _args.size(), std::string{});
            args.front() = _command;
            std::copy(_args.begin(), _args.end(), std::next(args.begin()));

            auto environment = _envs;

            // args and environment must each be a null-terminated array of pointers
            // Packed as follows: [ argv | nullptr | envp | nullptr ]
            std::vector<char *> combinedArgvEnvp;
            combinedArgvEnvp.reserve(2 + args.size() + environment.size());

            const auto addRange = [&combinedArgvEnvp](auto &&container) -> size_t {
                auto offset = combinedArgvEnvp.size();
                std::transform(
                    container.begin(),
                    container.end(),
                    std::back_inserter(combinedArgvEnvp),
                    [](auto &s) -> char * { return s.data(); });
                combinedArgvEnvp.push_back(nullptr);
                return offset;
            };

            auto argv = addRange(args);
            auto envp = addRange(environment);
            return start(
                _command,
                std::span{combinedArgvEnvp}.subspan(argv, args.size() + 1),
                std::span{combinedArgvEnvp}.subspan(envp));
        }

        template<class StringLike>
        std::enable_if_t<std::is_convertible_v<StringLike, std::string>, Startable &> withCommand(
            StringLike &&command) noexcept(std::is_same_v<std::string, StringLike>) {
            _command = std::string{std::forward<StringLike>(command)};
            return *this;
        }

        Startable &withArguments(std::vector<std::string> arguments) noexcept {
            _args = std::move(arguments);
            return *this;
        }

        // NAME=VALUE entries, replaces the whole environment of the child
        Startable &withEnvironment(std::vector<std::string> environment) noexcept {
            _envs = std::move(environment);
            return *this;
        }

        Startable &withOutput(OutputCallback out) noexcept {
            _outHandler = std::move(out);
            return *this;
        }

        Startable &withError(OutputCallback error) noexcept {
            _errHandler = std::move(error);
            return *this;
        }
    };
} // namespace ipc
