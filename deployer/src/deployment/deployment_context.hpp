#pragma once
#include "data/value.hpp"
#include <filesystem>
#include <memory>
#include <optional>

namespace deployment {

    /**
     * Read-only view of the "deployment" object of a deployment webhook event, including its
     * nested payload.
     */
    class DeploymentContext {
        std::shared_ptr<data::Map> _deployment;
        std::shared_ptr<data::Map> _payload;

    public:
        explicit DeploymentContext(const std::shared_ptr<data::Map> &deployment);

        /**
         * Context from a parsed webhook event, empty if the event has no deployment object.
         */
        static std::shared_ptr<const DeploymentContext> fromEvent(const data::Value &event);

        /**
         * Context from a webhook event file. An unreadable or malformed file is logged and
         * treated as an event without a deployment.
         */
        static std::shared_ptr<const DeploymentContext> fromEventFile(
            const std::filesystem::path &path);

        [[nodiscard]] data::Value field(std::string_view name) const;

        [[nodiscard]] data::Value payloadField(std::string_view name) const;

        [[nodiscard]] data::Value id() const {
            return field("id");
        }

        /**
         * Deployment id as used in API paths, empty if the event carries none.
         */
        [[nodiscard]] std::string idString() const;

        [[nodiscard]] const data::Map &payload() const noexcept {
            return *_payload;
        }
    };
} // namespace deployment
