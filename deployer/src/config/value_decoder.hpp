#pragma once
#include "data/value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace config {

    /**
     * Values to pass as --set pairs, in mapping order, plus an optional opaque expression
     * passed through as-is.
     */
    struct ValueSet {
        std::vector<std::pair<std::string, data::Value>> entries;
        std::optional<std::string> expression;

        [[nodiscard]] bool empty() const noexcept {
            return entries.empty() && !expression.has_value();
        }
    };

    struct PluginSpec {
        std::string url;
        std::optional<std::string> version;

        bool operator==(const PluginSpec &other) const = default;
    };

    /**
     * Text form of a value as it appears on a command line. Strings are used as-is, numbers and
     * booleans use their JSON text, containers use compact JSON, null is empty.
     */
    [[nodiscard]] std::string renderValue(const data::Value &value);

    /**
     * Right hand side of a --set pair. As renderValue, except null is written as "null" so
     * helm removes the key.
     */
    [[nodiscard]] std::string renderSetValue(const data::Value &value);

    /**
     * Strings are parsed as JSON where possible, otherwise kept as a single expression.
     */
    [[nodiscard]] ValueSet decodeValues(const data::Value &raw);

    /**
     * Accepts a list, a JSON list string or a single URL. Entries without a usable url are
     * dropped with a warning.
     */
    [[nodiscard]] std::vector<PluginSpec> decodePlugins(const data::Value &raw);

    /**
     * Accepts a list, a JSON list string or a single path. Empty and non-string entries are
     * dropped.
     */
    [[nodiscard]] std::vector<std::string> decodeValueFiles(const data::Value &raw);

    /**
     * true/yes/on/1 and false/no/off/0 (any case). Null and the empty string give dflt; any
     * other non-empty string is true.
     */
    [[nodiscard]] bool parseFlag(const data::Value &raw, bool dflt = false);

    [[nodiscard]] inline bool parseFlag(const std::optional<data::Value> &raw, bool dflt = false) {
        return raw.has_value() ? parseFlag(raw.value(), dflt) : dflt;
    }
} // namespace config
