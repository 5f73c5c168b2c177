#pragma once
#include "error_base.hpp"

namespace errors {

    class MissingRequiredInputError : public Error {
    public:
        explicit MissingRequiredInputError(const std::string &name)
            : Error("MissingRequiredInputError", "Input required and not supplied: " + name) {
        }
    };

    class MissingRepoAliasError : public Error {
    public:
        explicit MissingRepoAliasError(
            const std::string &what = "repo alias is required when you are setting a repository")
            : Error("MissingRepoAliasError", what) {
        }
    };

    class PluginInstallError : public Error {
    public:
        explicit PluginInstallError(const std::string &what)
            : Error("PluginInstallError", what) {
        }
    };

    class ToolInvocationError : public Error {
        int _exitCode;

    public:
        ToolInvocationError(const std::string &what, int exitCode)
            : Error("ToolInvocationError", what), _exitCode(exitCode) {
        }

        [[nodiscard]] int exitCode() const noexcept {
            return _exitCode;
        }
    };

    class StatusReportError : public Error {
    public:
        explicit StatusReportError(const std::string &what) : Error("StatusReportError", what) {
        }
    };

    class JsonParseError : public Error {
    public:
        explicit JsonParseError(const std::string &what = "Unable to parse JSON")
            : Error("JsonParseError", what) {
        }
    };

    class ValueTypeError : public Error {
    public:
        explicit ValueTypeError(const std::string &what = "Value has unexpected type")
            : Error("ValueTypeError", what) {
        }
    };

    class CommandLineArgumentError : public Error {
    public:
        explicit CommandLineArgumentError(const std::string &what)
            : Error("CommandLineArgumentError", what) {
        }
    };

    class ConfigFileError : public Error {
    public:
        explicit ConfigFileError(const std::string &what) : Error("ConfigFileError", what) {
        }
    };

} // namespace errors
