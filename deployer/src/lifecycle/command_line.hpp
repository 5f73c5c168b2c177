#pragma once

#include "command_line_arguments.hpp"
#include "data/value.hpp"
#include "logging/log_manager.hpp"
#include "sys_properties.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lifecycle {

    /**
     * Options of the helm-deployer executable.
     */
    class CommandLine final {
    private:
        std::optional<std::filesystem::path> _inputsPath;
        std::optional<std::filesystem::path> _eventPath;
        std::filesystem::path _helmHome;
        std::filesystem::path _workDir;
        std::shared_ptr<data::Map> _params{std::make_shared<data::Map>()};
        std::optional<logging::Level> _logLevel;
        std::optional<logging::Format> _logFormat;
        bool _helpRequested{false};

    public:
        CommandLine();

        /**
         * Parse argv, the first element being the program name.
         * @throws errors::CommandLineArgumentError on unknown options or bad values
         */
        void parseRawProgramNameAndArgs(std::span<char *const> args);
        void parseArgs(const std::vector<std::string> &args);

        /**
         * Fill defaults from the environment: event path from GITHUB_EVENT_PATH, and debug
         * logging when RUNNER_DEBUG=1 unless a level was given explicitly.
         */
        void parseEnv(const SysProperties &env);

        static void printHelp(std::ostream &out);

        /**
         * @param nameValue parameter in name=value form
         */
        void addParam(std::string_view nameValue);
        void setLogLevel(std::string_view level);
        void setLogFormat(std::string_view format);

        void setInputsPath(std::filesystem::path path) {
            _inputsPath = std::move(path);
        }

        void setEventPath(std::filesystem::path path) {
            _eventPath = std::move(path);
        }

        void setHelmHome(std::filesystem::path path) {
            _helmHome = std::move(path);
        }

        void setWorkDir(std::filesystem::path path) {
            _workDir = std::move(path);
        }

        void requestHelp() noexcept {
            _helpRequested = true;
        }

        [[nodiscard]] bool isHelpRequested() const noexcept {
            return _helpRequested;
        }

        [[nodiscard]] const std::optional<std::filesystem::path> &getInputsPath() const {
            return _inputsPath;
        }

        [[nodiscard]] const std::optional<std::filesystem::path> &getEventPath() const {
            return _eventPath;
        }

        [[nodiscard]] const std::filesystem::path &getHelmHome() const {
            return _helmHome;
        }

        [[nodiscard]] const std::filesystem::path &getWorkDir() const {
            return _workDir;
        }

        [[nodiscard]] std::shared_ptr<data::Map> getParams() const {
            return _params;
        }

        [[nodiscard]] std::optional<logging::Level> getLogLevel() const {
            return _logLevel;
        }

        [[nodiscard]] std::optional<logging::Format> getLogFormat() const {
            return _logFormat;
        }
    };

} // namespace lifecycle
