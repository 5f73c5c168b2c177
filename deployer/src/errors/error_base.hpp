#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace errors {

    /**
     * Base of all errors raised by the deployer. An error is described by the tuple
     * {Kind,Message} where Kind is a short type name and Message is a non-empty string.
     */
    class Error : public std::runtime_error {
        inline static const char *const DEFAULT_ERROR_TEXT = "Unspecified Error";
        std::string _kind;

    public:
        Error(const Error &) = default;
        Error(Error &&) noexcept = default;
        Error &operator=(const Error &) = default;
        Error &operator=(Error &&) noexcept = default;
        ~Error() noexcept override = default;

        explicit Error(std::string_view kind, const std::string &what = DEFAULT_ERROR_TEXT)
            : std::runtime_error(what), _kind(kind) {
        }

        /**
         * Convert any standard exception to an Error, preserving kind where known.
         */
        [[nodiscard]] static Error of(const std::exception &err) {
            if(const auto *asError = dynamic_cast<const Error *>(&err)) {
                return *asError;
            }
            if(dynamic_cast<const std::logic_error *>(&err) != nullptr) {
                return Error("std::logic_error", err.what());
            }
            if(dynamic_cast<const std::runtime_error *>(&err) != nullptr) {
                return Error("std::runtime_error", err.what());
            }
            return Error("std::exception", err.what());
        }

        [[nodiscard]] const std::string &kind() const noexcept {
            return _kind;
        }
    };

} // namespace errors
